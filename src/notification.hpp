#pragma once

#include <dbus/dbus.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

// Desktop notifications over org.freedesktop.Notifications. Runs on a private session bus
// connection so Poll() never steals messages addressed to the tray icon.
class Notification {
  public:
    using ActionCallback = std::function<void(const std::string &action)>;

    struct Action {
        std::string id;
        std::string label;
    };

    Notification();
    ~Notification();

    Notification(const Notification &) = delete;
    Notification &operator=(const Notification &) = delete;

    // Passed to the action callback when the user closes the notification.
    static constexpr const char *kDismissedAction = "dismissed";

    bool IsConnected() const { return m_Conn != nullptr; }

    // Returns the server-assigned id, 0 on failure. A non-zero replacesId updates that
    // notification in place.
    uint32_t SendNotification(const std::string &icon, const std::string &summary,
                              const std::string &msg, uint32_t replacesId = 0,
                              int32_t timeoutMs = 5000, bool critical = false);
    uint32_t SendActionNotification(const std::string &icon, const std::string &summary,
                                    const std::string &msg, const std::vector<Action> &actions,
                                    ActionCallback callback, uint32_t replacesId = 0,
                                    int32_t timeoutMs = 0, bool critical = false);
    void CloseNotification(uint32_t id);
    void Poll();

  private:
    uint32_t Notify(const std::string &icon, const std::string &summary, const std::string &msg,
                    const std::vector<Action> &actions, uint32_t replacesId, int32_t timeoutMs,
                    bool critical);
    void HandleSignalMessage(DBusMessage *message);

    DBusError m_Err;
    DBusConnection *m_Conn{nullptr};

    std::chrono::time_point<std::chrono::system_clock> m_LastNotification{};
    std::unordered_map<uint32_t, ActionCallback> m_ActionCallbacks;
};
