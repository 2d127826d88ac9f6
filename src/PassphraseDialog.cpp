#include "PassphraseDialog.hpp"

#include <QHBoxLayout>
#include <QVBoxLayout>

PassphraseDialog::PassphraseDialog(QWidget *parent)
    : QDialog(parent), m_subtitle(new QLabel), m_edit(new QLineEdit),
      m_echo_button(new QToolButton), m_error_label(new QLabel),
      m_unlock_button(new QPushButton(tr("Unlock PDF"))),
      m_cancel_button(new QPushButton(tr("Cancel")))
{
    setWindowTitle(tr("Password Required"));
    setWindowFlags(windowFlags() & ~Qt::WindowContextHelpButtonHint
                   & ~Qt::WindowMaximizeButtonHint);
    setModal(true);
    setMinimumWidth(380);

    QLabel *title = new QLabel(tr("Password Required"));
    QFont titleFont = title->font();
    titleFont.setBold(true);
    titleFont.setPointSizeF(titleFont.pointSizeF() * 1.2);
    title->setFont(titleFont);

    m_subtitle->setText(tr("This PDF is password-protected"));

    m_edit->setEchoMode(QLineEdit::Password);
    m_edit->setPlaceholderText(tr("Enter PDF password"));

    m_echo_button->setText(tr("Show"));
    m_echo_button->setCheckable(true);
    m_echo_button->setFocusPolicy(Qt::NoFocus);

    m_error_label->setStyleSheet("QLabel { color : #d64545; }");
    m_error_label->hide();

    m_unlock_button->setDefault(true);
    m_unlock_button->setEnabled(false);

    QHBoxLayout *editLayout = new QHBoxLayout();
    editLayout->addWidget(m_edit);
    editLayout->addWidget(m_echo_button);

    QHBoxLayout *buttonLayout = new QHBoxLayout();
    buttonLayout->addWidget(m_cancel_button);
    buttonLayout->addWidget(m_unlock_button);

    QVBoxLayout *layout = new QVBoxLayout(this);
    layout->addWidget(title);
    layout->addWidget(m_subtitle);
    layout->addSpacing(8);
    layout->addLayout(editLayout);
    layout->addWidget(m_error_label);
    layout->addLayout(buttonLayout);

    connect(m_edit, &QLineEdit::textChanged, this,
            &PassphraseDialog::updateUnlockButton);
    connect(m_echo_button, &QToolButton::toggled, this,
            &PassphraseDialog::toggleEcho);
    connect(m_unlock_button, &QPushButton::clicked, this,
            &PassphraseDialog::accept);
    connect(m_cancel_button, &QPushButton::clicked, this,
            &PassphraseDialog::reject);

    m_edit->setFocus();
}

void
PassphraseDialog::setRequest(const PassphraseGate::Request &request) noexcept
{
    m_edit->clear();
    m_edit->setFocus();

    if (request.lastAttemptFailed)
    {
        m_error_label->setText(tr("Incorrect password (attempt %1)")
                                   .arg(request.attemptNumber - 1));
        m_error_label->show();
    }
    else
    {
        m_error_label->clear();
        m_error_label->hide();
    }
}

QString
PassphraseDialog::passphrase() const noexcept
{
    return m_edit->text();
}

// A blank entry cannot unlock anything
void
PassphraseDialog::updateUnlockButton() noexcept
{
    m_unlock_button->setEnabled(!m_edit->text().trimmed().isEmpty());
}

void
PassphraseDialog::toggleEcho() noexcept
{
    const bool show = m_echo_button->isChecked();
    m_edit->setEchoMode(show ? QLineEdit::Normal : QLineEdit::Password);
    m_echo_button->setText(show ? tr("Hide") : tr("Show"));
}
