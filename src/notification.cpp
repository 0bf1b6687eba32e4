#include "notification.hpp"

#include <cstring>

#include <spdlog/spdlog.h>

namespace {
static constexpr const char *kBusName = "org.freedesktop.Notifications";
static constexpr const char *kObjPath = "/org/freedesktop/Notifications";
static constexpr const char *kIface = "org.freedesktop.Notifications";
static constexpr const char *kAppName = "Steadfast";

static void dict_append_byte(DBusMessageIter *dictIter, const char *key, unsigned char value) {
    DBusMessageIter entry;
    DBusMessageIter variant;
    dbus_message_iter_open_container(dictIter, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "y", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BYTE, &value);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dictIter, &entry);
}
} // namespace

// ─────────────────────────────────────
Notification::Notification() {
    dbus_error_init(&m_Err);
    m_Conn = dbus_bus_get_private(DBUS_BUS_SESSION, &m_Err);
    if (dbus_error_is_set(&m_Err) || !m_Conn) {
        spdlog::error("Failed to connect to session bus: {}",
                      dbus_error_is_set(&m_Err) ? m_Err.message : "unknown error");
        dbus_error_free(&m_Err);
        m_Conn = nullptr;
        return;
    }

    dbus_connection_set_exit_on_disconnect(m_Conn, FALSE);

    // ActionInvoked and NotificationClosed are broadcast; ask the bus to route them to us.
    dbus_bus_add_match(m_Conn,
                       "type='signal',interface='org.freedesktop.Notifications',"
                       "path='/org/freedesktop/Notifications'",
                       &m_Err);
    if (dbus_error_is_set(&m_Err)) {
        spdlog::warn("Notification actions unavailable: {}", m_Err.message);
        dbus_error_free(&m_Err);
    }
}

// ─────────────────────────────────────
Notification::~Notification() {
    if (m_Conn) {
        dbus_connection_close(m_Conn);
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
    }

    if (dbus_error_is_set(&m_Err)) {
        dbus_error_free(&m_Err);
    }
}

// ─────────────────────────────────────
uint32_t Notification::SendNotification(const std::string &icon, const std::string &summary,
                                        const std::string &msg, uint32_t replacesId,
                                        int32_t timeoutMs, bool critical) {
    // Plain notifications are informational; drop bursts of new ones but always allow updates.
    const auto now = std::chrono::system_clock::now();
    if (replacesId == 0 && now - m_LastNotification < std::chrono::seconds(1)) {
        spdlog::debug("Notification skipped: rate limit exceeded");
        return 0;
    }

    uint32_t id = Notify(icon, summary, msg, {}, replacesId, timeoutMs, critical);
    if (id != 0) {
        m_LastNotification = now;
    }
    return id;
}

// ─────────────────────────────────────
uint32_t Notification::SendActionNotification(const std::string &icon, const std::string &summary,
                                              const std::string &msg,
                                              const std::vector<Action> &actions,
                                              ActionCallback callback, uint32_t replacesId,
                                              int32_t timeoutMs, bool critical) {
    uint32_t id = Notify(icon, summary, msg, actions, replacesId, timeoutMs, critical);
    if (id == 0) {
        return 0;
    }

    if (replacesId != 0 && replacesId != id) {
        m_ActionCallbacks.erase(replacesId);
    }
    m_ActionCallbacks[id] = std::move(callback);
    return id;
}

// ─────────────────────────────────────
uint32_t Notification::Notify(const std::string &icon, const std::string &summary,
                              const std::string &msg, const std::vector<Action> &actions,
                              uint32_t replacesId, int32_t timeoutMs, bool critical) {
    if (!m_Conn) {
        spdlog::debug("Notification '{}' dropped: no session bus", summary);
        return 0;
    }

    DBusMessage *m = dbus_message_new_method_call(kBusName, kObjPath, kIface, "Notify");
    if (!m) {
        spdlog::error("Failed to create DBus message");
        return 0;
    }

    DBusMessageIter args;
    dbus_message_iter_init_append(m, &args);

    const char *app_name = kAppName;
    const char *icon_c = icon.c_str();
    const char *summary_c = summary.c_str();
    const char *body_c = msg.c_str();

    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &app_name);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_UINT32, &replacesId);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &icon_c);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &summary_c);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &body_c);

    // ── Actions ──
    DBusMessageIter actionIter;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "s", &actionIter);
    for (const auto &action : actions) {
        const char *id_c = action.id.c_str();
        const char *label_c = action.label.c_str();
        dbus_message_iter_append_basic(&actionIter, DBUS_TYPE_STRING, &id_c);
        dbus_message_iter_append_basic(&actionIter, DBUS_TYPE_STRING, &label_c);
    }
    dbus_message_iter_close_container(&args, &actionIter);

    // ── Hints ──
    DBusMessageIter hints;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "{sv}", &hints);
    dict_append_byte(&hints, "urgency", critical ? 2 : 1);
    dbus_message_iter_close_container(&args, &hints);

    dbus_message_iter_append_basic(&args, DBUS_TYPE_INT32, &timeoutMs);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage *reply = dbus_connection_send_with_reply_and_block(m_Conn, m, 1000, &err);
    dbus_message_unref(m);

    if (!reply) {
        spdlog::warn("Notify failed: {}", dbus_error_is_set(&err) ? err.message : "no reply");
        if (dbus_error_is_set(&err)) {
            dbus_error_free(&err);
        }
        return 0;
    }

    uint32_t id = 0;
    if (!dbus_message_get_args(reply, &err, DBUS_TYPE_UINT32, &id, DBUS_TYPE_INVALID)) {
        spdlog::warn("Notify reply malformed: {}",
                     dbus_error_is_set(&err) ? err.message : "missing id");
        if (dbus_error_is_set(&err)) {
            dbus_error_free(&err);
        }
    }
    dbus_message_unref(reply);
    return id;
}

// ─────────────────────────────────────
void Notification::CloseNotification(uint32_t id) {
    if (!m_Conn || id == 0) {
        return;
    }

    m_ActionCallbacks.erase(id);

    DBusMessage *m = dbus_message_new_method_call(kBusName, kObjPath, kIface, "CloseNotification");
    if (!m) {
        spdlog::error("Failed to create DBus message");
        return;
    }
    dbus_message_append_args(m, DBUS_TYPE_UINT32, &id, DBUS_TYPE_INVALID);
    if (!dbus_connection_send(m_Conn, m, nullptr)) {
        spdlog::error("Failed to send CloseNotification");
    }
    dbus_message_unref(m);
    dbus_connection_flush(m_Conn);
}

// ─────────────────────────────────────
void Notification::Poll() {
    if (!m_Conn) {
        return;
    }

    dbus_connection_read_write(m_Conn, 0);
    DBusMessage *msg;
    while ((msg = dbus_connection_pop_message(m_Conn)) != nullptr) {
        HandleSignalMessage(msg);
        dbus_message_unref(msg);
    }
}

// ─────────────────────────────────────
void Notification::HandleSignalMessage(DBusMessage *message) {
    if (dbus_message_is_signal(message, kIface, "ActionInvoked")) {
        uint32_t id = 0;
        const char *action = nullptr;
        if (!dbus_message_get_args(message, nullptr, DBUS_TYPE_UINT32, &id, DBUS_TYPE_STRING,
                                   &action, DBUS_TYPE_INVALID)) {
            return;
        }

        auto it = m_ActionCallbacks.find(id);
        if (it == m_ActionCallbacks.end()) {
            return;
        }
        // The callback may send a replacement notification, so take it out first.
        ActionCallback callback = std::move(it->second);
        m_ActionCallbacks.erase(it);
        spdlog::debug("Notification {} action '{}'", id, action ? action : "");
        callback(action ? action : "");
        return;
    }

    if (dbus_message_is_signal(message, kIface, "NotificationClosed")) {
        uint32_t id = 0;
        uint32_t reason = 0;
        if (!dbus_message_get_args(message, nullptr, DBUS_TYPE_UINT32, &id, DBUS_TYPE_UINT32,
                                   &reason, DBUS_TYPE_INVALID)) {
            return;
        }

        auto it = m_ActionCallbacks.find(id);
        if (it == m_ActionCallbacks.end()) {
            return;
        }
        ActionCallback callback = std::move(it->second);
        m_ActionCallbacks.erase(it);
        // 2 = dismissed by the user
        if (reason == 2) {
            callback(kDismissedAction);
        }
    }
}
