#include "UiAlerts.hpp"

namespace UiAlerts {

QMessageBox::StandardButton
show(QWidget *parent, QMessageBox::Icon icon, const QString &title,
     const QString &text, QMessageBox::StandardButtons buttons,
     QMessageBox::StandardButton defaultButton) {
    QMessageBox box(parent);
    box.setTextFormat(Qt::PlainText);
    box.setWindowModality(parent ? Qt::WindowModal : Qt::ApplicationModal);
    box.setIcon(icon);
    box.setWindowTitle(title);
    box.setText(text);
    box.setStandardButtons(buttons);
    if (buttons.testFlag(defaultButton))
        box.setDefaultButton(defaultButton);
    return static_cast<QMessageBox::StandardButton>(box.exec());
}

void information(QWidget *parent, const QString &title, const QString &text) {
    show(parent, QMessageBox::Information, title, text);
}

void warning(QWidget *parent, const QString &title, const QString &text) {
    show(parent, QMessageBox::Warning, title, text);
}

void critical(QWidget *parent, const QString &title, const QString &text) {
    show(parent, QMessageBox::Critical, title, text);
}

bool confirm(QWidget *parent, const QString &title, const QString &text) {
    return show(parent, QMessageBox::Question, title, text,
                QMessageBox::Yes | QMessageBox::No,
                QMessageBox::No) == QMessageBox::Yes;
}

} // namespace UiAlerts
