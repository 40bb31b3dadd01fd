#include "optionsdialog.h"
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QLabel>
#include <QVBoxLayout>

namespace otv {

OptionsDialog::OptionsDialog(const TreeOptions& current, QWidget* parent)
    : QDialog(parent)
{
    setWindowTitle("Options");
    setMinimumWidth(420);

    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setSpacing(8);
    mainLayout->setContentsMargins(10, 10, 10, 10);

    // Expansion group box
    auto* expandGroup = new QGroupBox("Expansion");
    auto* expandLayout = new QFormLayout(expandGroup);
    expandLayout->setSpacing(8);
    expandLayout->setFieldGrowthPolicy(QFormLayout::ExpandingFieldsGrow);

    m_childLimitSpin = new QSpinBox;
    m_childLimitSpin->setRange(1, 100000);
    m_childLimitSpin->setSingleStep(50);
    m_childLimitSpin->setValue(current.childLimit);
    m_childLimitSpin->setSuffix(" rows");
    m_childLimitSpin->setObjectName("childLimitSpin");
    expandLayout->addRow("Child limit:", m_childLimitSpin);

    auto* limitDesc = new QLabel(
        "Maximum number of child rows shown when an object is expanded. "
        "Further children are not listed. Default: 200.");
    limitDesc->setWordWrap(true);
    expandLayout->addRow(limitDesc);

    mainLayout->addWidget(expandGroup);

    // Appearance group box
    auto* visualGroup = new QGroupBox("Appearance");
    auto* visualLayout = new QFormLayout(visualGroup);
    visualLayout->setSpacing(8);
    visualLayout->setFieldGrowthPolicy(QFormLayout::ExpandingFieldsGrow);

    m_fontCombo = new QFontComboBox;
    m_fontCombo->setCurrentFont(QFont(current.fontFamily));
    m_fontCombo->setObjectName("fontCombo");
    visualLayout->addRow("Tree font:", m_fontCombo);

    m_fontSizeSpin = new QSpinBox;
    m_fontSizeSpin->setRange(4, 72);
    m_fontSizeSpin->setValue(current.fontPointSize);
    m_fontSizeSpin->setSuffix(" pt");
    m_fontSizeSpin->setObjectName("fontSizeSpin");
    visualLayout->addRow("Font size:", m_fontSizeSpin);

    m_headerHeightSpin = new QSpinBox;
    m_headerHeightSpin->setRange(8, 200);
    m_headerHeightSpin->setValue(current.headerHeight);
    m_headerHeightSpin->setSuffix(" px");
    m_headerHeightSpin->setObjectName("headerHeightSpin");
    visualLayout->addRow("Header height:", m_headerHeightSpin);

    mainLayout->addWidget(visualGroup);
    mainLayout->addStretch();

    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    mainLayout->addWidget(buttons);
}

TreeOptions OptionsDialog::result() const {
    TreeOptions r;
    r.childLimit = m_childLimitSpin->value();
    r.headerHeight = m_headerHeightSpin->value();
    r.fontFamily = m_fontCombo->currentFont().family();
    r.fontPointSize = m_fontSizeSpin->value();
    return r;
}

} // namespace otv
