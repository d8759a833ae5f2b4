#pragma once

#include <QMessageBox>

class QString;
class QWidget;

// Modal message boxes with plain-text bodies. Peer supplied names (nicks,
// file names) end up in these texts and must never be read as rich text.
namespace UiAlerts {
QMessageBox::StandardButton
show(QWidget *parent, QMessageBox::Icon icon, const QString &title,
     const QString &text,
     QMessageBox::StandardButtons buttons = QMessageBox::Ok,
     QMessageBox::StandardButton defaultButton = QMessageBox::Ok);

void information(QWidget *parent, const QString &title, const QString &text);
void warning(QWidget *parent, const QString &title, const QString &text);
// Usable before any window exists (startup failures).
void critical(QWidget *parent, const QString &title, const QString &text);

// Yes/No with No as the default. True on Yes.
bool confirm(QWidget *parent, const QString &title, const QString &text);
} // namespace UiAlerts
