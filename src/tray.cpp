#include "tray.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <string>
#include <unistd.h>

namespace {
static constexpr const char *kObjPath = "/StatusNotifierItem";
static constexpr const char *kIfaceSNI = "org.kde.StatusNotifierItem";
static constexpr const char *kIfaceProps = "org.freedesktop.DBus.Properties";
static constexpr const char *kIfaceIntro = "org.freedesktop.DBus.Introspectable";
static constexpr const char *kWatcher = "org.kde.StatusNotifierWatcher";
static constexpr const char *kProperties[] = {"Category", "Id",       "Title",
                                              "Status",   "IconName", "AttentionIconName"};

static void append_variant_string(DBusMessageIter *iter, const char *value) {
    DBusMessageIter variant;
    const char *sig = "s";
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, sig, &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(iter, &variant);
}

static void dict_append_string(DBusMessageIter *dictIter, const char *key, const char *value) {
    DBusMessageIter entry;
    dbus_message_iter_open_container(dictIter, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    append_variant_string(&entry, value);
    dbus_message_iter_close_container(dictIter, &entry);
}
// Logs and frees a DBus error. Returns false so callers can bail out in one line.
static bool fail(const char *what, DBusError &err) {
    if (dbus_error_is_set(&err)) {
        spdlog::warn("Tray: {}: {}", what, err.message);
        dbus_error_free(&err);
    } else {
        spdlog::warn("Tray: {}", what);
    }
    return false;
}
} // namespace

// ─────────────────────────────────────
TrayIcon::~TrayIcon() {
    if (m_Conn) {
        dbus_connection_remove_filter(m_Conn, &TrayIcon::FilterHandler, this);
        dbus_connection_unregister_object_path(m_Conn, kObjPath);
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
    }
}

// ─────────────────────────────────────
const char *TrayIcon::IconNameFor(TrayState state) {
    switch (state) {
    case TRAY_FOCUSED:
        return "steadfast-focused";
    case TRAY_DISTRACTED:
        return "steadfast-distracted";
    case TRAY_IDLE:
        break;
    }
    return "steadfast-idle";
}

// ─────────────────────────────────────
const char *TrayIcon::StatusFor(TrayState state) {
    switch (state) {
    case TRAY_DISTRACTED:
        return "NeedsAttention";
    case TRAY_IDLE:
        return "Passive";
    case TRAY_FOCUSED:
        break;
    }
    return "Active";
}

// ─────────────────────────────────────
bool TrayIcon::Start(std::string title) {
    if (m_Started) {
        return true;
    }

    m_Title = std::move(title);

    DBusError err;
    dbus_error_init(&err);

    DBusConnection *conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (!conn) {
        return fail("no session bus", err);
    }
    dbus_connection_set_exit_on_disconnect(conn, FALSE);

    // One name per process; elements can't start with a digit, hence the P.
    m_BusName = "io.Steadfast.Tray.P" + std::to_string(static_cast<long>(getpid()));

    static const DBusObjectPathVTable vtable{nullptr, &TrayIcon::MessageHandler};
    const bool owned = dbus_bus_request_name(conn, m_BusName.c_str(),
                                             DBUS_NAME_FLAG_REPLACE_EXISTING,
                                             &err) == DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER;
    if (!owned || !dbus_connection_register_object_path(conn, kObjPath, &vtable, this)) {
        dbus_connection_unref(conn);
        return fail(owned ? "object path taken" : "bus name refused", err);
    }
    m_Conn = conn;

    dbus_connection_add_filter(m_Conn, &TrayIcon::FilterHandler, this, nullptr);
    dbus_bus_add_match(m_Conn,
                       "type='signal',sender='org.freedesktop.DBus',"
                       "interface='org.freedesktop.DBus',member='NameOwnerChanged',"
                       "arg0='org.kde.StatusNotifierWatcher'",
                       &err);
    if (dbus_error_is_set(&err)) {
        fail("watcher owner match", err);
    }

    RegisterWithWatcher();
    m_Started = true;
    spdlog::info("Tray: StatusNotifierItem exported as {}{}", m_BusName, kObjPath);
    return true;
}

// ─────────────────────────────────────
void TrayIcon::Poll() {
    if (!m_Conn) {
        return;
    }

    // Non-blocking; drain everything that arrived since the last turn of the loop.
    dbus_connection_read_write(m_Conn, 0);
    while (dbus_connection_dispatch(m_Conn) == DBUS_DISPATCH_DATA_REMAINS) {
    }
}

// ─────────────────────────────────────
void TrayIcon::SetTrayState(TrayState state) {
    if (state == m_State) {
        return;
    }

    const bool statusChanged = std::strcmp(StatusFor(state), StatusFor(m_State)) != 0;
    m_State = state;
    m_IconName = IconNameFor(state);
    spdlog::debug("Tray: icon -> {}", m_IconName);

    if (!m_Started) {
        return;
    }
    EmitSignal("NewIcon");
    if (statusChanged) {
        EmitSignal("NewStatus", StatusFor(state));
    }
    EmitPropertiesChanged();
    dbus_connection_flush(m_Conn);
}

// ─────────────────────────────────────
DBusHandlerResult TrayIcon::MessageHandler(DBusConnection *conn, DBusMessage *msg, void *user_data) {
    auto *self = static_cast<TrayIcon *>(user_data);
    if (!self) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }
    return self->HandleMessage(conn, msg);
}

// ─────────────────────────────────────
DBusHandlerResult TrayIcon::HandleMessage(DBusConnection *conn, DBusMessage *msg) {
    if (dbus_message_get_type(msg) != DBUS_MESSAGE_TYPE_METHOD_CALL) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    const char *iface = dbus_message_get_interface(msg);
    const char *member = dbus_message_get_member(msg);
    if (!iface || !member) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }
    auto is = [&](const char *i, const char *m) {
        return std::strcmp(iface, i) == 0 && std::strcmp(member, m) == 0;
    };

    if (is(kIfaceIntro, "Introspect")) {
        ReplyIntrospect(conn, msg);
    } else if (is(kIfaceProps, "Get")) {
        ReplyGetProperty(conn, msg);
    } else if (is(kIfaceProps, "GetAll")) {
        ReplyGetAllProperties(conn, msg);
    } else if (is(kIfaceSNI, "Activate")) {
        // Left click means "take me back to my task".
        ReplyEmptyMethodReturn(conn, msg);
        spdlog::info("Tray: activated");
        if (m_OnActivate) {
            m_OnActivate();
        }
    } else if (std::strcmp(iface, kIfaceSNI) == 0) {
        // SecondaryActivate, ContextMenu, Scroll: accepted and ignored.
        ReplyEmptyMethodReturn(conn, msg);
    } else {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }
    return DBUS_HANDLER_RESULT_HANDLED;
}

// ─────────────────────────────────────
DBusHandlerResult TrayIcon::FilterHandler(DBusConnection *conn, DBusMessage *msg, void *user_data) {
    auto *self = static_cast<TrayIcon *>(user_data);
    if (!self) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }
    return self->HandleFilter(conn, msg);
}

// ─────────────────────────────────────
DBusHandlerResult TrayIcon::HandleFilter(DBusConnection *, DBusMessage *msg) {
    if (!dbus_message_is_signal(msg, "org.freedesktop.DBus", "NameOwnerChanged")) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    const char *name = nullptr;
    const char *oldOwner = nullptr;
    const char *newOwner = nullptr;
    if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &name, DBUS_TYPE_STRING, &oldOwner,
                               DBUS_TYPE_STRING, &newOwner, DBUS_TYPE_INVALID)) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    if (name && std::strcmp(name, kWatcher) == 0 && newOwner && *newOwner) {
        spdlog::info("Tray: watcher restarted, registering again");
        RegisterWithWatcher();
    }
    // Other filters may want this signal too.
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

// ─────────────────────────────────────
void TrayIcon::RegisterWithWatcher() {
    if (!m_Conn) {
        return;
    }

    DBusMessage *msg = dbus_message_new_method_call(kWatcher, "/StatusNotifierWatcher", kWatcher,
                                                    "RegisterStatusNotifierItem");
    if (!msg) {
        return;
    }

    const char *name = m_BusName.c_str();
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &name, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage *reply = dbus_connection_send_with_reply_and_block(m_Conn, msg, 1000, &err);
    if (!reply) {
        // No watcher running is not an error.
        if (dbus_error_is_set(&err)) {
            spdlog::debug("Tray: watcher registration failed: {}", err.message);
            dbus_error_free(&err);
        }
    } else {
        dbus_message_unref(reply);
    }

    dbus_message_unref(msg);
    dbus_connection_flush(m_Conn);
}

// ─────────────────────────────────────
void TrayIcon::EmitSignal(const char *member, const char *arg) {
    if (!m_Conn) {
        return;
    }
    DBusMessage *sig = dbus_message_new_signal(kObjPath, kIfaceSNI, member);
    if (!sig) {
        return;
    }
    if (arg) {
        dbus_message_append_args(sig, DBUS_TYPE_STRING, &arg, DBUS_TYPE_INVALID);
    }
    dbus_connection_send(m_Conn, sig, nullptr);
    dbus_message_unref(sig);
}

// ─────────────────────────────────────
void TrayIcon::EmitPropertiesChanged() {
    if (!m_Conn) {
        return;
    }

    DBusMessage *sig = dbus_message_new_signal(kObjPath, kIfaceProps, "PropertiesChanged");
    if (!sig) {
        return;
    }

    DBusMessageIter iter;
    dbus_message_iter_init_append(sig, &iter);

    const char *iface = kIfaceSNI;
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);

    DBusMessageIter dict;
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    dict_append_string(&dict, "IconName", m_IconName.c_str());
    dict_append_string(&dict, "Status", StatusFor(m_State));
    dbus_message_iter_close_container(&iter, &dict);

    DBusMessageIter invalidated;
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "s", &invalidated);
    dbus_message_iter_close_container(&iter, &invalidated);

    dbus_connection_send(m_Conn, sig, nullptr);
    dbus_message_unref(sig);
}

// ─────────────────────────────────────
void TrayIcon::ReplyIntrospect(DBusConnection *conn, DBusMessage *msg) {
    std::string xml = "<node>"
                      "<interface name='org.freedesktop.DBus.Introspectable'>"
                      "<method name='Introspect'><arg type='s' direction='out'/></method>"
                      "</interface>"
                      "<interface name='org.freedesktop.DBus.Properties'>"
                      "<method name='Get'><arg type='s' direction='in'/>"
                      "<arg type='s' direction='in'/><arg type='v' direction='out'/></method>"
                      "<method name='GetAll'><arg type='s' direction='in'/>"
                      "<arg type='a{sv}' direction='out'/></method>"
                      "<signal name='PropertiesChanged'><arg type='s'/><arg type='a{sv}'/>"
                      "<arg type='as'/></signal>"
                      "</interface>"
                      "<interface name='org.kde.StatusNotifierItem'>";
    for (const char *prop : kProperties) {
        xml += "<property name='";
        xml += prop;
        xml += "' type='s' access='read'/>";
    }
    for (const char *method : {"Activate", "SecondaryActivate", "ContextMenu"}) {
        xml += "<method name='";
        xml += method;
        xml += "'><arg name='x' type='i' direction='in'/><arg name='y' type='i' direction='in'/>"
               "</method>";
    }
    xml += "<signal name='NewIcon'/>"
           "<signal name='NewAttentionIcon'/>"
           "<signal name='NewStatus'><arg name='status' type='s'/></signal>"
           "</interface>"
           "</node>";

    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }

    const char *xml_c = xml.c_str();
    dbus_message_append_args(reply, DBUS_TYPE_STRING, &xml_c, DBUS_TYPE_INVALID);
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
const char *TrayIcon::GetPropString(const char *prop) const {
    if (std::strcmp(prop, "Category") == 0) {
        return "ApplicationStatus";
    }
    if (std::strcmp(prop, "Id") == 0) {
        return "steadfast";
    }
    if (std::strcmp(prop, "Title") == 0) {
        return m_Title.c_str();
    }
    if (std::strcmp(prop, "Status") == 0) {
        return StatusFor(m_State);
    }
    if (std::strcmp(prop, "IconName") == 0) {
        return m_IconName.c_str();
    }
    if (std::strcmp(prop, "AttentionIconName") == 0) {
        return IconNameFor(TRAY_DISTRACTED);
    }
    return nullptr;
}

// ─────────────────────────────────────
void TrayIcon::ReplyGetProperty(DBusConnection *conn, DBusMessage *msg) {
    const char *iface = nullptr;
    const char *prop = nullptr;

    DBusError err;
    dbus_error_init(&err);
    if (!dbus_message_get_args(msg, &err, DBUS_TYPE_STRING, &iface, DBUS_TYPE_STRING, &prop,
                               DBUS_TYPE_INVALID)) {
        spdlog::debug("Tray: Properties.Get args error: {}",
                      dbus_error_is_set(&err) ? err.message : "unknown");
        if (dbus_error_is_set(&err)) {
            dbus_error_free(&err);
        }
        ReplyError(conn, msg, DBUS_ERROR_INVALID_ARGS, "expected (ss)");
        return;
    }

    const char *value = (iface && std::strcmp(iface, kIfaceSNI) == 0 && prop)
                            ? GetPropString(prop)
                            : nullptr;
    if (!value) {
        ReplyError(conn, msg, DBUS_ERROR_UNKNOWN_PROPERTY, "no such property");
        return;
    }

    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }

    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);
    append_variant_string(&iter, value);

    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void TrayIcon::ReplyGetAllProperties(DBusConnection *conn, DBusMessage *msg) {
    const char *iface = nullptr;

    DBusError err;
    dbus_error_init(&err);
    if (!dbus_message_get_args(msg, &err, DBUS_TYPE_STRING, &iface, DBUS_TYPE_INVALID)) {
        if (dbus_error_is_set(&err)) {
            dbus_error_free(&err);
        }
        ReplyError(conn, msg, DBUS_ERROR_INVALID_ARGS, "expected (s)");
        return;
    }

    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }

    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);

    // Other interfaces get an empty dictionary.
    DBusMessageIter dict;
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    if (iface && std::strcmp(iface, kIfaceSNI) == 0) {
        for (const char *prop : kProperties) {
            dict_append_string(&dict, prop, GetPropString(prop));
        }
    }
    dbus_message_iter_close_container(&iter, &dict);

    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void TrayIcon::ReplyError(DBusConnection *conn, DBusMessage *msg, const char *name,
                          const char *text) {
    DBusMessage *reply = dbus_message_new_error(msg, name, text);
    if (!reply) {
        return;
    }
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void TrayIcon::ReplyEmptyMethodReturn(DBusConnection *conn, DBusMessage *msg) {
    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}
