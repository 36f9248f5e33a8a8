/*
 * demowindow.h — Small window exercising responsive props and themes
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef POLYSTYLE_DEMOWINDOW_H
#define POLYSTYLE_DEMOWINDOW_H

#include <QWidget>

#include "componentvariants.h"

class PropBag;
class QLabel;
class QPushButton;
class ThemeProvider;

class DemoWindow : public QWidget
{
    Q_OBJECT

public:
    explicit DemoWindow(ThemeProvider *provider, QWidget *parent = nullptr);

private:
    void buildUi();
    void applyStyles();
    void updateStatus();
    void applyProps(QWidget *widget, const PropBag &props, const QString &component = QString());
    void applyProps(QWidget *widget, const PropBag &props, const VariantSelection &variants,
                    const QString &component = QString());

    ThemeProvider *m_provider = nullptr;
    QLabel *m_title = nullptr;
    QWidget *m_card = nullptr;
    QLabel *m_caption = nullptr;
    QLabel *m_status = nullptr;
    QPushButton *m_toggleButton = nullptr;
};

#endif // POLYSTYLE_DEMOWINDOW_H
