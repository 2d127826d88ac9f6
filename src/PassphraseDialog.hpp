#pragma once

#include "PassphraseGate.hpp"

#include <QDialog>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QToolButton>

class PassphraseDialog : public QDialog
{
    Q_OBJECT

public:
    explicit PassphraseDialog(QWidget *parent = nullptr);

    void setRequest(const PassphraseGate::Request &request) noexcept;
    QString passphrase() const noexcept;

private:
    void updateUnlockButton() noexcept;
    void toggleEcho() noexcept;

    QLabel *m_subtitle{nullptr};
    QLineEdit *m_edit{nullptr};
    QToolButton *m_echo_button{nullptr};
    QLabel *m_error_label{nullptr};
    QPushButton *m_unlock_button{nullptr};
    QPushButton *m_cancel_button{nullptr};
};
