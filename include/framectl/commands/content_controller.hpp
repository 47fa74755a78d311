/**
 * @file content_controller.hpp
 * @brief Picture-frame content commands.
 *
 * Collection management (list, upload, select, filters, thumbnails, delete)
 * goes through the companion surface under /api/v2/art/ms/. Art-mode state is
 * queried and toggled with art requests on the control channel.
 *
 * An uploaded piece is not guaranteed to show up in an immediately following
 * list(); callers that need confirmation poll list() themselves.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "framectl/commands/art_types.hpp"
#include "framectl/core/options.hpp"
#include "framectl/core/rest/companion_client.hpp"
#include "framectl/core/session/connection_session.hpp"

namespace framectl {

    /**
     * @struct MultipartBody
     * @brief Encoded multipart/form-data upload body.
     */
    struct MultipartBody {
        std::string boundary;
        std::string contentType;    ///< "multipart/form-data; boundary=..."
        std::string body;
    };

    /**
     * @brief Encode an image upload: a "file" part and an optional "matte" part.
     */
    MultipartBody encodeUpload(const std::vector<uint8_t>& bytes,
                               ImageType type,
                               std::optional<MatteStyle> matte,
                               const std::string& boundary);

    class ContentController {
    public:
        ContentController(ConnectionSession& session, CompanionAPIClient& rest, ContentOptions opts = {})
            : session_(session), rest_(rest), opts_(opts) {}

        /**
         * @brief Art pieces currently stored on the device. Entries without an id are skipped.
         * @throws RequestError
         */
        std::vector<ArtPiece> list();

        /**
         * @brief Upload an image.
         * @return the content id assigned by the device
         * @throws ValidationError before anything is sent if the payload is rejected locally
         * @throws RequestError(MalformedBody) if the reply carries no content id
         */
        std::string upload(const std::vector<uint8_t>& bytes,
                           ImageType type,
                           std::optional<MatteStyle> matte = std::nullopt);

        void select(const std::string& contentId, bool show = true);

        std::vector<PhotoFilter> availableFilters();

        void applyFilter(const std::string& contentId, PhotoFilter filter);

        std::vector<uint8_t> thumbnail(const std::string& contentId);

        void remove(const std::string& contentId);

        /// @name Control-channel art requests
        /// @{
        bool artModeStatus();
        void setArtMode(bool on);
        /// Raw reply of get_current_artwork (content_id, matte_id, ...).
        nlohmann::json currentArtwork();
        /// @}

        /**
         * @brief Issue an art request; @p extra is merged into the request document.
         * @throws CallError, TransportError
         */
        nlohmann::json artRequest(const std::string& request, const nlohmann::json& extra = nlohmann::json::object());

        static nlohmann::json artRequestParams(const std::string& request,
                                               const std::string& id,
                                               const nlohmann::json& extra);

    private:
        static std::string contentPath(const std::string& contentId, const char* suffix = "");

        ConnectionSession&  session_;
        CompanionAPIClient& rest_;
        ContentOptions      opts_;
    };

}
