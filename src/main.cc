// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include <giomm/init.h>
#include <google/protobuf/stubs/common.h>
#include "application/Application.h"

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;
    Gio::init();

    auto app = Sentinel::Application::create();
    const int status = app->run(argc, argv);

    google::protobuf::ShutdownProtobufLibrary();
    return status;
}
