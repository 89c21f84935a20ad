// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include <giomm/init.h>
#include "application/Application.h"

int main(int argc, char* argv[]) {
    Gio::init();

    auto app = Pulsar::Application::create();
    return app->run(argc, argv);
}
