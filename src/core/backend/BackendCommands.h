// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file BackendCommands.h
 * @brief Names of the vault backend commands reachable through BackendInvoker
 *
 * The backend owns encryption, storage, import/export and clipboard policy.
 * Each command takes a JSON object and returns JSON or a BackendError.
 */

#ifndef PULSAR_BACKEND_COMMANDS_H
#define PULSAR_BACKEND_COMMANDS_H

#include <array>
#include <string_view>

namespace Pulsar::BackendCommand {

// Session and vault selection
inline constexpr std::string_view SWITCH_DATABASE = "switch_database";
inline constexpr std::string_view LIST_VAULTS = "list_vaults";
inline constexpr std::string_view IS_MASTER_PASSWORD_CONFIGURED = "is_master_password_configured";
inline constexpr std::string_view SET_MASTER_PASSWORD = "set_master_password";
inline constexpr std::string_view UNLOCK = "unlock";
inline constexpr std::string_view UNLOCK_WITH_BIOMETRICS = "unlock_with_biometrics";
inline constexpr std::string_view LOCK = "lock";

// Items
inline constexpr std::string_view GET_PASSWORD_ITEMS = "get_password_items";
inline constexpr std::string_view DELETE_PASSWORD_ITEM = "delete_password_item";
inline constexpr std::string_view UPDATE_PASSWORD_TAGS = "update_password_tags";
inline constexpr std::string_view GET_BUTTONS = "get_buttons";

// Backup
inline constexpr std::string_view EXPORT_VAULT_BACKEND = "export_vault_backend";
inline constexpr std::string_view EXPORT_VAULT = "export_vault";
inline constexpr std::string_view RESTORE_VAULT_BACKEND = "restore_vault_backend";
inline constexpr std::string_view IMPORT_VAULT = "import_vault";
inline constexpr std::string_view RESTORE_VAULT_SNAPSHOT = "restore_vault_snapshot";
inline constexpr std::string_view WIPE_VAULT_DATABASE = "wipe_vault_database";

// Clipboard
inline constexpr std::string_view ELEVATED_COPY = "elevated_copy";
inline constexpr std::string_view APPLY_CLIPBOARD_POLICY = "apply_clipboard_policy";
inline constexpr std::string_view GET_CLIPBOARD_CAPABILITIES = "get_clipboard_capabilities";
inline constexpr std::string_view CLEAR_CLIPBOARD = "clear_clipboard";

// Devices and activity
inline constexpr std::string_view LIST_DEVICES = "list_devices";
inline constexpr std::string_view REMOVE_DEVICE = "remove_device";
inline constexpr std::string_view REVOKE_ALL_DEVICES = "revoke_all_devices";
inline constexpr std::string_view GET_ACTIVITY_LOG = "get_activity_log";
inline constexpr std::string_view CLEAR_ACTIVITY_LOG = "clear_activity_log";
inline constexpr std::string_view GET_SECURITY_REPORT = "get_security_report";

// Files
inline constexpr std::string_view CHECK_FILE_EXISTS = "check_file_exists";
inline constexpr std::string_view PICK_OPEN_FILE = "pick_open_file";
inline constexpr std::string_view PICK_SAVE_FILE = "pick_save_file";

inline constexpr std::array<std::string_view, 30> ALL = {
    SWITCH_DATABASE, LIST_VAULTS, IS_MASTER_PASSWORD_CONFIGURED, SET_MASTER_PASSWORD,
    UNLOCK, UNLOCK_WITH_BIOMETRICS, LOCK,
    GET_PASSWORD_ITEMS, DELETE_PASSWORD_ITEM, UPDATE_PASSWORD_TAGS, GET_BUTTONS,
    EXPORT_VAULT_BACKEND, EXPORT_VAULT, RESTORE_VAULT_BACKEND, IMPORT_VAULT,
    RESTORE_VAULT_SNAPSHOT, WIPE_VAULT_DATABASE,
    ELEVATED_COPY, APPLY_CLIPBOARD_POLICY, GET_CLIPBOARD_CAPABILITIES, CLEAR_CLIPBOARD,
    LIST_DEVICES, REMOVE_DEVICE, REVOKE_ALL_DEVICES, GET_ACTIVITY_LOG, CLEAR_ACTIVITY_LOG,
    GET_SECURITY_REPORT,
    CHECK_FILE_EXISTS, PICK_OPEN_FILE, PICK_SAVE_FILE};

} // namespace Pulsar::BackendCommand

#endif // PULSAR_BACKEND_COMMANDS_H
