#include "framectl/commands/app_manager.hpp"
#include "framectl/core/util/error_types.hpp"
#include "framectl/core/util/logger.hpp"
#include <format>
#include <future>
#include <mutex>
#include <memory>

namespace framectl {

    namespace {
        constexpr const char* kInstalledEvent = "ed.installedApp.get";

        std::string stringField(const nlohmann::json& j, std::initializer_list<const char*> keys) {
            for (auto k : keys) {
                auto it = j.find(k);
                if (it != j.end() && it->is_string()) return it->get<std::string>();
            }
            return {};
        }
    }

    const char* toString(AppStatus s) {
        switch (s) {
        case AppStatus::Stopped: return "stopped";
        case AppStatus::Running: return "running";
        case AppStatus::Visible: return "visible";
        default:                 return "unknown";
        }
    }

    std::vector<AppInfo> parseInstalledApps(const nlohmann::json& data) {
        std::vector<AppInfo> out;
        const nlohmann::json* arr = &data;
        if (data.is_object()) {
            auto it = data.find("data");
            if (it == data.end()) return out;
            arr = &*it;
        }
        if (!arr->is_array()) return out;

        for (auto const& e : *arr) {
            if (!e.is_object()) continue;
            AppInfo a;
            a.id = stringField(e, { "appId", "id" });
            if (a.id.empty()) continue;
            a.name = stringField(e, { "name" });
            if (auto v = stringField(e, { "version" }); !v.empty()) a.version = v;
            out.push_back(std::move(a));
        }
        return out;
    }

    AppInfo parseAppStatus(const nlohmann::json& j) {
        AppInfo a;
        if (!j.is_object()) return a;
        a.id = stringField(j, { "id", "appId" });
        a.name = stringField(j, { "name" });
        if (auto v = stringField(j, { "version" }); !v.empty()) a.version = v;
        if (j.contains("running") && j["running"].is_boolean()) {
            bool running = j["running"].get<bool>();
            bool visible = j.value("visible", false);
            a.status = !running ? AppStatus::Stopped : visible ? AppStatus::Visible : AppStatus::Running;
        }
        return a;
    }

    std::string AppManager::appPath(const std::string& appId) {
        if (appId.empty()) throw ValidationError("application id is empty");
        return "/api/v2/applications/" + appId;
    }

    std::vector<AppInfo> AppManager::list() {
        session_.auth().requireScope(TokenScope::AppManagement);

        auto reply = std::make_shared<std::promise<nlohmann::json>>();
        auto fut = reply->get_future();
        auto once = std::make_shared<std::once_flag>();
        auto& router = session_.router();
        HandlerId hid = router.addEventObserver([reply, once](const Event& ev) {
            if (ev.name != kInstalledEvent) return;
            std::call_once(*once, [&] { reply->set_value(ev.data); });
        });

        try {
            session_.post("ms.channel.emit", { {"event", kInstalledEvent}, {"to", "host"} });
        } catch (const std::exception&) {
            router.removeEventObserver(hid);
            throw;
        }

        auto ready = fut.wait_for(listTimeout_) == std::future_status::ready;
        router.removeEventObserver(hid);
        if (!ready)
            throw CallError(CallError::Kind::Timeout,
                            std::format("no installed-app list within {}ms", listTimeout_.count()));
        auto apps = parseInstalledApps(fut.get());
        LOG_DEBUG(std::format("{} lists {} apps", session_.host(), apps.size()));
        return apps;
    }

    void AppManager::launch(const std::string& appId) {
        session_.auth().requireScope(TokenScope::AppManagement);
        rest_.request("POST", appPath(appId));
    }

    void AppManager::close(const std::string& appId) {
        session_.auth().requireScope(TokenScope::AppManagement);
        rest_.request("DELETE", appPath(appId));
    }

    AppInfo AppManager::status(const std::string& appId) {
        session_.auth().requireScope(TokenScope::AppManagement);
        auto info = parseAppStatus(rest_.requestJson("GET", appPath(appId)));
        if (info.id.empty()) info.id = appId;
        return info;
    }

    void AppManager::install(const std::string& appId) {
        session_.auth().requireScope(TokenScope::AppManagement);
        rest_.request("PUT", appPath(appId));
    }

    std::vector<uint8_t> AppManager::icon(const std::string& appId) {
        session_.auth().requireScope(TokenScope::AppManagement);
        auto res = rest_.request("GET", appPath(appId) + "/icon", { { "Accept", "image/*" } });
        return { res.body.begin(), res.body.end() };
    }

}
