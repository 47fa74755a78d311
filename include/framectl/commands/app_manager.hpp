/**
 * @file app_manager.hpp
 * @brief Installed-application commands.
 *
 * Listing is a control-channel request answered by an ed.installedApp.get
 * event; lifecycle operations use /api/v2/applications/{id}.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "framectl/core/options.hpp"
#include "framectl/core/rest/companion_client.hpp"
#include "framectl/core/session/connection_session.hpp"

namespace framectl {

    enum class AppStatus { Unknown, Stopped, Running, Visible };

    const char* toString(AppStatus s);

    struct AppInfo {
        std::string                 id;
        std::string                 name;
        std::optional<std::string>  version;
        AppStatus                   status{ AppStatus::Unknown };
    };

    /**
     * @brief Decode the data.data array of an ed.installedApp.get event.
     */
    std::vector<AppInfo> parseInstalledApps(const nlohmann::json& data);

    /**
     * @brief Decode a GET /api/v2/applications/{id} document.
     */
    AppInfo parseAppStatus(const nlohmann::json& j);

    class AppManager {
    public:
        AppManager(ConnectionSession& session,
                   CompanionAPIClient& rest,
                   std::chrono::milliseconds listTimeout = std::chrono::seconds(5))
            : session_(session), rest_(rest), listTimeout_(listTimeout) {}

        /**
         * @brief Installed applications.
         * @throws CallError(Timeout) if the device does not answer in time
         */
        std::vector<AppInfo> list();

        /// @throws RequestError(Status) with status 404 if the app is not installed
        void launch(const std::string& appId);
        void close(const std::string& appId);
        AppInfo status(const std::string& appId);
        void install(const std::string& appId);

        /// Raw icon image bytes from GET /api/v2/applications/{id}/icon.
        std::vector<uint8_t> icon(const std::string& appId);

    private:
        static std::string appPath(const std::string& appId);

        ConnectionSession&          session_;
        CompanionAPIClient&         rest_;
        std::chrono::milliseconds   listTimeout_;
    };

}
