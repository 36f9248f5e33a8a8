/*
 * demowindow.cpp — Small window exercising responsive props and themes
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "demowindow.h"

#include "breakpointcontext.h"
#include "propbag.h"
#include "themeprovider.h"

#include <KLocalizedString>

#include <QFrame>
#include <QJsonDocument>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QVBoxLayout>

DemoWindow::DemoWindow(ThemeProvider *provider, QWidget *parent)
    : QWidget(parent)
    , m_provider(provider)
{
    setWindowTitle(i18n("PolyStyle Demo"));
    resize(800, 520);

    buildUi();
    applyStyles();
    updateStatus();

    connect(m_provider->breakpointContext(this), &BreakpointContext::breakpointChanged,
            this, &DemoWindow::updateStatus);
    m_provider->subscribe(this, [this](const Theme &) { updateStatus(); });

    connect(m_toggleButton, &QPushButton::clicked, this, [this]() {
        StyleError error;
        if (!m_provider->toggleColorScheme(&error))
            qWarning("DemoWindow: cannot toggle color scheme: %s", qPrintable(error.toString()));
    });
}

void DemoWindow::buildUi()
{
    auto *layout = new QVBoxLayout(this);

    m_title = new QLabel(i18n("Responsive styling"), this);
    layout->addWidget(m_title);

    auto *card = new QFrame(this);
    card->setObjectName(QStringLiteral("card"));
    auto *cardLayout = new QVBoxLayout(card);
    auto *body = new QLabel(i18n("Resize the window: padding and type scale with the breakpoint."),
                            card);
    body->setWordWrap(true);
    m_caption = new QLabel(card);
    m_caption->setObjectName(QStringLiteral("caption"));
    cardLayout->addWidget(body);
    cardLayout->addWidget(m_caption);
    m_card = card;
    layout->addWidget(m_card);

    auto *input = new QLineEdit(this);
    input->setPlaceholderText(i18n("Focus me"));
    layout->addWidget(input);
    applyProps(input, PropBag(), {{VariantType::Style, QStringLiteral("filled")},
                                  {VariantType::Size, QStringLiteral("sm")}});

    m_toggleButton = new QPushButton(i18n("Toggle color scheme"), this);
    layout->addWidget(m_toggleButton);
    applyProps(m_toggleButton, PropBag(), {{VariantType::Style, QStringLiteral("light")},
                                           {VariantType::Size, QStringLiteral("md")}});

    m_status = new QLabel(this);
    layout->addWidget(m_status);
    layout->addStretch();
}

void DemoWindow::applyStyles()
{
    PropBag windowProps;
    windowProps.set(QStringLiteral("bg"), QStringLiteral("body"))
               .set(QStringLiteral("c"), QStringLiteral("text"));
    applyProps(this, windowProps);

    PropBag titleProps;
    titleProps.set(QStringLiteral("fz"), ResponsiveValue{{QStringLiteral("base"), QStringLiteral("lg")},
                                                         {QStringLiteral("md"), QStringLiteral("h3")},
                                                         {QStringLiteral("lg"), QStringLiteral("h1")}})
              .set(QStringLiteral("fw"), QStringLiteral("bold"))
              .set(QStringLiteral("c"), QStringLiteral("bright"));
    applyProps(m_title, titleProps);

    // Same shape a theme file would use for a component override
    const QByteArray cardJson = R"({
        "p": { "base": "sm", "md": "md", "lg": "xl" },
        "bg": "default",
        "bd": "1px solid",
        "bdc": "default-border",
        "bdrs": "md",
        ":hover": { "bdc": "primary" },
        "styles": { "caption": { "c": "dimmed", "fz": "sm" } }
    })";
    m_provider->declareTargets(m_card, {{QStringLiteral("caption"), QStringLiteral("QLabel#caption")}});
    applyProps(m_card, PropBag::fromJson(QJsonDocument::fromJson(cardJson).object()),
               QStringLiteral("Card"));

    PropBag statusProps;
    statusProps.set(QStringLiteral("c"), QStringLiteral("dimmed"))
               .set(QStringLiteral("fz"), QStringLiteral("xs"))
               .set(QStringLiteral("mt"), QStringLiteral("md"));
    applyProps(m_status, statusProps);
}

void DemoWindow::applyProps(QWidget *widget, const PropBag &props, const QString &component)
{
    applyProps(widget, props, VariantSelection(), component);
}

void DemoWindow::applyProps(QWidget *widget, const PropBag &props,
                            const VariantSelection &variants, const QString &component)
{
    StyleError error;
    if (!m_provider->resolveAndApply(widget, props, variants, component, &error))
        qWarning("DemoWindow: cannot style %s: %s", widget->metaObject()->className(),
                 qPrintable(error.toString()));
}

void DemoWindow::updateStatus()
{
    const Theme &theme = m_provider->theme();
    const QString breakpoint = m_provider->activeBreakpoint(this);
    m_status->setText(i18n("Scheme: %1, primary: %2, breakpoint: %3, theme version %4",
                           Theme::schemeName(theme.colorScheme), theme.primaryColor,
                           breakpoint, QString::number(m_provider->themeVersion())));
    m_caption->setText(i18n("Active breakpoint: %1", breakpoint));
}
