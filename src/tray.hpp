#pragma once

#include <dbus/dbus.h>

#include <functional>
#include <string>

enum TrayState { TRAY_IDLE, TRAY_FOCUSED, TRAY_DISTRACTED };

// StatusNotifierItem used as the block timer indicator. Not thread safe; Poll() and every
// setter run on the daemon's owner thread.
class TrayIcon {
  public:
    TrayIcon() = default;
    ~TrayIcon();

    TrayIcon(const TrayIcon &) = delete;
    TrayIcon &operator=(const TrayIcon &) = delete;

    bool Start(std::string title);
    void Poll();
    void SetTrayState(TrayState state);
    void SetActivateHandler(std::function<void()> handler) { m_OnActivate = std::move(handler); }
    TrayState State() const { return m_State; }

    static const char *IconNameFor(TrayState state);
    static const char *StatusFor(TrayState state);

  private:
    static DBusHandlerResult MessageHandler(DBusConnection *conn, DBusMessage *msg,
                                            void *user_data);
    DBusHandlerResult HandleMessage(DBusConnection *conn, DBusMessage *msg);

    // Watcher restarts (e.g. the bar after suspend) forget registered items.
    static DBusHandlerResult FilterHandler(DBusConnection *conn, DBusMessage *msg, void *user_data);
    DBusHandlerResult HandleFilter(DBusConnection *conn, DBusMessage *msg);

    void RegisterWithWatcher();
    void EmitSignal(const char *member, const char *arg = nullptr);
    void EmitPropertiesChanged();

    void ReplyIntrospect(DBusConnection *conn, DBusMessage *msg);
    void ReplyGetProperty(DBusConnection *conn, DBusMessage *msg);
    void ReplyGetAllProperties(DBusConnection *conn, DBusMessage *msg);
    void ReplyEmptyMethodReturn(DBusConnection *conn, DBusMessage *msg);
    void ReplyError(DBusConnection *conn, DBusMessage *msg, const char *name, const char *text);

    const char *GetPropString(const char *prop) const;

  private:
    DBusConnection *m_Conn = nullptr;
    std::string m_BusName;
    std::string m_Title;
    std::string m_IconName = IconNameFor(TRAY_IDLE);
    TrayState m_State = TRAY_IDLE;
    bool m_Started = false;
    std::function<void()> m_OnActivate;
};
