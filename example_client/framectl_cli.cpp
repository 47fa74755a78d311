// Small diagnostics tool on top of framectl.
//
//   framectl_cli discover [seconds]
//   framectl_cli info <host>
//   framectl_cli key <host> KEY_POWER [KEY_...]
//   framectl_cli art <host> status|on|off|list
//   framectl_cli apps <host>
//   framectl_cli monitor <host> [seconds]
//
// Tokens are kept in ./framectl-token.json between runs.
#include "framectl/framectl.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <thread>

using namespace framectl;

namespace {

    class FileTokenStore : public ITokenStore {
    public:
        explicit FileTokenStore(std::filesystem::path path) : path_(std::move(path)) {}

        std::optional<AuthenticationToken> load() override {
            std::ifstream in(path_);
            if (!in) return std::nullopt;
            auto j = nlohmann::json::parse(in, nullptr, false);
            if (j.is_discarded()) {
                LOG_WARN("ignoring unreadable token file " + path_.string());
                return std::nullopt;
            }
            try {
                return j.get<AuthenticationToken>();
            } catch (const nlohmann::json::exception& e) {
                LOG_WARN(std::format("ignoring token file {}: {}", path_.string(), e.what()));
                return std::nullopt;
            }
        }

        void save(const AuthenticationToken& token) override {
            std::ofstream out(path_, std::ios::trunc);
            out << nlohmann::json(token).dump(2);
        }

        void remove() override {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }

    private:
        std::filesystem::path path_;
    };

    int usage() {
        std::cerr << "usage: framectl_cli discover [seconds]\n"
                     "       framectl_cli info <host>\n"
                     "       framectl_cli key <host> KEY_... [KEY_...]\n"
                     "       framectl_cli art <host> status|on|off|list\n"
                     "       framectl_cli apps <host>\n"
                     "       framectl_cli monitor <host> [seconds]\n";
        return 2;
    }

    ClientOptions loadOptions() {
        std::ifstream in("framectl.json");
        if (!in) return {};
        return ClientOptions::fromJson(nlohmann::json::parse(in));
    }

    int discover(int seconds) {
        DiscoveryEngine engine(loadOptions().discovery);
        auto stream = engine.discover(std::chrono::seconds(seconds));
        while (auto r = stream.next())
            std::cout << std::format("{:<16} {:<24} {:<6} {}\n", r->device.address, r->device.name,
                                     toString(r->method), r->device.modelName);
        return 0;
    }

}

int main(int argc, char** argv) {
    Logger::inst().setLevel(LogLevel::Warn);
    if (argc < 2) return usage();
    std::string cmd = argv[1];

    try {
        if (cmd == "discover") return discover(argc > 2 ? std::stoi(argv[2]) : 5);
        if (argc < 3) return usage();

        FrameClient tv(argv[2], loadOptions(), std::make_shared<FileTokenStore>("framectl-token.json"));
        tv.onStateChange([](SessionState from, SessionState to) {
            std::cerr << std::format("[{} -> {}]\n", toString(from), toString(to));
        });

        if (cmd == "info") {
            auto info = tv.deviceInfo();
            std::cout << info.raw.dump(2) << '\n';
            return 0;
        }

        tv.connect();

        if (cmd == "key") {
            std::vector<Key> keys;
            for (int i = 3; i < argc; ++i) {
                auto k = keyFromString(argv[i]);
                if (!k) {
                    std::cerr << "unknown key " << argv[i] << '\n';
                    return 2;
                }
                keys.push_back(*k);
            }
            tv.remote().sendKeys(keys);
        } else if (cmd == "art" && argc > 3) {
            std::string sub = argv[3];
            if (sub == "status")    std::cout << (tv.content().artModeStatus() ? "on" : "off") << '\n';
            else if (sub == "on")   tv.content().setArtMode(true);
            else if (sub == "off")  tv.content().setArtMode(false);
            else if (sub == "list") {
                for (auto const& p : tv.content().list())
                    std::cout << std::format("{:<14} {:<10} {}\n", p.id, toString(p.category), p.title);
            } else return usage();
        } else if (cmd == "apps") {
            for (auto const& a : tv.apps().list())
                std::cout << std::format("{:<16} {}\n", a.id, a.name);
        } else if (cmd == "monitor") {
            int seconds = argc > 3 ? std::stoi(argv[3]) : 30;
            tv.addRawObserver([](const std::string& frame) { std::cout << "<< " << frame << '\n'; });
            std::this_thread::sleep_for(std::chrono::seconds(seconds));
        } else {
            return usage();
        }
        tv.disconnect();
    } catch (const Error& e) {
        std::cerr << std::format("error ({}): {}\n", toString(e.code()), e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
