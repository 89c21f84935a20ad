// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file Application.h
 * @brief Command-line application class for Pulsar Generator
 */

#ifndef PULSAR_APPLICATION_H
#define PULSAR_APPLICATION_H

#include "GeneratorCommand.h"
#include <giomm/application.h>
#include <glibmm/variantdict.h>
#include <memory>

namespace Pulsar {

class CurlHttpClient;
class GeneratorSettings;

/**
 * @brief Main application class for pulsar-gen
 *
 * A non-unique Gio::Application that registers its command-line options,
 * handles them in the local instance and exits with the command's status.
 * Nothing is ever activated remotely.
 *
 * @section services Owned Services
 * - GeneratorSettings (absent when the schema is not installed)
 * - PasswordPresetStore
 * - CurlHttpClient and BreachChecker
 */
class Application : public Gio::Application {
public:
    /**
     * @brief Factory method to create Application instance
     * @return RefPtr to new Application instance
     */
    static Glib::RefPtr<Application> create();

    ~Application() override;

protected:
    Application();

    /**
     * @brief Called if no local handling ended the process
     */
    void on_activate() override;

private:
    void add_options();
    void create_services();

    /**
     * @brief Translate parsed GOption values into CommandOptions and run them
     * @return Exit status
     */
    int on_handle_local_options(const Glib::RefPtr<Glib::VariantDict>& options);

    [[nodiscard]] static CommandOptions
    to_command_options(const Glib::RefPtr<Glib::VariantDict>& options);

    std::unique_ptr<GeneratorSettings> m_settings;
    std::unique_ptr<PasswordPresetStore> m_presets;
    std::unique_ptr<CurlHttpClient> m_http_client;
    std::unique_ptr<BreachChecker> m_breach_checker;
};

} // namespace Pulsar

#endif // PULSAR_APPLICATION_H
