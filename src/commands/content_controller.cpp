#include "framectl/commands/content_controller.hpp"
#include "framectl/core/util/error_types.hpp"
#include "framectl/core/util/logger.hpp"
#include "internal/core/util/random.hpp"
#include <format>

namespace framectl {

    namespace {
        constexpr const char* kArtBase    = "/api/v2/art/ms";
        constexpr const char* kEmitMethod = "ms.channel.emit";

        /// Listings arrive as a bare array or wrapped in content/data/items.
        const nlohmann::json* findArray(const nlohmann::json& j) {
            if (j.is_array()) return &j;
            if (!j.is_object()) return nullptr;
            for (auto key : { "content", "data", "items", "filters" }) {
                auto it = j.find(key);
                if (it != j.end() && it->is_array()) return &*it;
            }
            return nullptr;
        }
    }

    MultipartBody encodeUpload(const std::vector<uint8_t>& bytes,
                               ImageType type,
                               std::optional<MatteStyle> matte,
                               const std::string& boundary) {
        MultipartBody m;
        m.boundary = boundary;
        m.contentType = "multipart/form-data; boundary=" + boundary;

        auto& b = m.body;
        b.reserve(bytes.size() + 512);
        b += "--" + boundary + "\r\n";
        b += std::format("Content-Disposition: form-data; name=\"file\"; filename=\"upload.{}\"\r\n", toString(type));
        b += std::format("Content-Type: {}\r\n\r\n", mimeType(type));
        b.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        b += "\r\n";
        if (matte) {
            b += "--" + boundary + "\r\n";
            b += "Content-Disposition: form-data; name=\"matte\"\r\n\r\n";
            b += std::string(toString(*matte)) + "\r\n";
        }
        b += "--" + boundary + "--\r\n";
        return m;
    }

    std::string ContentController::contentPath(const std::string& contentId, const char* suffix) {
        if (contentId.empty()) throw ValidationError("content id is empty");
        return std::format("{}/content/{}{}", kArtBase, contentId, suffix);
    }

    std::vector<ArtPiece> ContentController::list() {
        session_.auth().requireScope(TokenScope::ArtMode);
        auto j = rest_.requestJson("GET", std::string(kArtBase) + "/content", nullptr, std::nullopt,
                                   [](const nlohmann::json& doc) {
                                       if (!doc.is_null() && !findArray(doc))
                                           throw RequestError(RequestError::Kind::MalformedBody,
                                                              "content listing is not an array");
                                   });

        std::vector<ArtPiece> out;
        auto arr = findArray(j);
        if (!arr) return out;
        for (auto const& e : *arr) {
            if (auto p = parseArtPiece(e)) out.push_back(std::move(*p));
            else LOG_DEBUG("skipping content entry without id: " + e.dump());
        }
        return out;
    }

    std::string ContentController::upload(const std::vector<uint8_t>& bytes,
                                          ImageType type,
                                          std::optional<MatteStyle> matte) {
        session_.auth().requireScope(TokenScope::ArtMode);
        validateImage(bytes, type);

        auto mp = encodeUpload(bytes, type, matte, "framectl-" + randomUuid());
        LOG_INFO(std::format("uploading {} bytes ({}) to {}", bytes.size(), toString(type), rest_.host()));
        std::string contentId;
        rest_.request("POST", std::string(kArtBase) + "/content/upload",
                      { { "Content-Type", mp.contentType } },
                      mp.body, opts_.uploadTimeout,
                      [&contentId](const HttpResponse& res) {
                          auto j = nlohmann::json::parse(res.body, nullptr, false);
                          if (j.is_object()) {
                              for (auto key : { "content_id", "contentId", "id" }) {
                                  auto it = j.find(key);
                                  if (it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
                                      contentId = it->get<std::string>();
                                      return;
                                  }
                              }
                          }
                          throw RequestError(RequestError::Kind::MalformedBody,
                                             "upload reply carries no content id", res.status);
                      });
        return contentId;
    }

    void ContentController::select(const std::string& contentId, bool show) {
        session_.auth().requireScope(TokenScope::ArtMode);
        rest_.requestJson("POST", contentPath(contentId, "/select"), { {"show", show} });
    }

    std::vector<PhotoFilter> ContentController::availableFilters() {
        session_.auth().requireScope(TokenScope::ArtMode);
        auto j = rest_.requestJson("GET", std::string(kArtBase) + "/filters");

        std::vector<PhotoFilter> out;
        auto arr = findArray(j);
        if (!arr) return out;
        for (auto const& e : *arr) {
            std::string name;
            if (e.is_string()) name = e.get<std::string>();
            else if (e.is_object()) name = e.value("filter_id", e.value("id", std::string{}));
            if (auto f = filterFromString(name)) out.push_back(*f);
            else LOG_DEBUG("unknown photo filter '" + name + "'");
        }
        return out;
    }

    void ContentController::applyFilter(const std::string& contentId, PhotoFilter filter) {
        session_.auth().requireScope(TokenScope::ArtMode);
        rest_.requestJson("POST", contentPath(contentId, "/filter"), { {"filter_id", std::string(toString(filter))} });
    }

    std::vector<uint8_t> ContentController::thumbnail(const std::string& contentId) {
        session_.auth().requireScope(TokenScope::ArtMode);
        auto res = rest_.request("GET", contentPath(contentId, "/thumbnail"));
        return { res.body.begin(), res.body.end() };
    }

    void ContentController::remove(const std::string& contentId) {
        session_.auth().requireScope(TokenScope::ArtMode);
        rest_.request("DELETE", contentPath(contentId));
    }

    nlohmann::json ContentController::artRequestParams(const std::string& request,
                                                       const std::string& id,
                                                       const nlohmann::json& extra) {
        nlohmann::json data = extra.is_object() ? extra : nlohmann::json::object();
        data["request"] = request;
        data["id"] = id;
        data["request_id"] = id;
        return {
            {"event", "art_app_request"},
            {"to", "host"},
            {"data", data.dump()},
        };
    }

    nlohmann::json ContentController::artRequest(const std::string& request, const nlohmann::json& extra) {
        session_.auth().requireScope(TokenScope::ArtMode);
        auto fut = session_.callAsync(kEmitMethod,
                                      [&request, extra](const std::string& id) {
                                          return artRequestParams(request, id, extra);
                                      },
                                      opts_.artTimeout);
        return fut.get();
    }

    bool ContentController::artModeStatus() {
        auto r = artRequest("get_artmode_status");
        if (!r.is_object() || !r.contains("value"))
            throw CallError(CallError::Kind::Protocol, "art mode status reply carries no value");
        return r["value"] == "on";
    }

    void ContentController::setArtMode(bool on) {
        artRequest("set_artmode_status", { {"value", on ? "on" : "off"} });
    }

    nlohmann::json ContentController::currentArtwork() {
        return artRequest("get_current_artwork");
    }

}
