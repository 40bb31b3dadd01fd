#pragma once
#include "treeoptions.h"
#include <QDialog>
#include <QFontComboBox>
#include <QSpinBox>

namespace otv {

class OptionsDialog : public QDialog {
    Q_OBJECT
public:
    explicit OptionsDialog(const TreeOptions& current, QWidget* parent = nullptr);

    TreeOptions result() const;

private:
    QSpinBox*      m_childLimitSpin   = nullptr;
    QSpinBox*      m_headerHeightSpin = nullptr;
    QFontComboBox* m_fontCombo        = nullptr;
    QSpinBox*      m_fontSizeSpin     = nullptr;
};

} // namespace otv
