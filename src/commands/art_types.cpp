#include "framectl/commands/art_types.hpp"
#include "framectl/core/util/error_types.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <format>
#include <utility>

namespace framectl {

    namespace {

        constexpr std::array<std::pair<MatteStyle, std::string_view>, 9> kMattes{ {
            { MatteStyle::None,          "none" },
            { MatteStyle::ModernBeige,   "modern_beige" },
            { MatteStyle::ModernApricot, "modern_apricot" },
            { MatteStyle::ModernIvory,   "modern_ivory" },
            { MatteStyle::ModernBrown,   "modern_brown" },
            { MatteStyle::ModernWalnut,  "modern_walnut" },
            { MatteStyle::VintageWhite,  "vintage_white" },
            { MatteStyle::VintageBeige,  "vintage_beige" },
            { MatteStyle::VintageWalnut, "vintage_walnut" },
        } };

        constexpr std::array<std::pair<PhotoFilter, std::string_view>, 7> kFilters{ {
            { PhotoFilter::None,        "none" },
            { PhotoFilter::Ink,         "ink" },
            { PhotoFilter::Watercolor,  "watercolor" },
            { PhotoFilter::Pencil,      "pencil" },
            { PhotoFilter::Pastel,      "pastel" },
            { PhotoFilter::Comic,       "comic" },
            { PhotoFilter::OilPainting, "oil_painting" },
        } };

        std::string firstString(const nlohmann::json& j, std::initializer_list<const char*> keys) {
            for (auto k : keys) {
                auto it = j.find(k);
                if (it == j.end()) continue;
                if (it->is_string() && !it->get<std::string>().empty()) return it->get<std::string>();
                if (it->is_number_integer()) return std::to_string(it->get<long long>());
            }
            return {};
        }

    }

    std::string_view toString(ImageType t) { return t == ImageType::Png ? "png" : "jpg"; }
    std::string_view mimeType(ImageType t) { return t == ImageType::Png ? "image/png" : "image/jpeg"; }

    std::string_view toString(ArtCategory c) {
        switch (c) {
        case ArtCategory::Purchased: return "purchased";
        case ArtCategory::Uploaded:  return "uploaded";
        default:                     return "preloaded";
        }
    }

    std::string_view toString(MatteStyle m) {
        for (auto const& [v, s] : kMattes) if (v == m) return s;
        return "none";
    }

    std::string_view toString(PhotoFilter f) {
        for (auto const& [v, s] : kFilters) if (v == f) return s;
        return "none";
    }

    std::optional<MatteStyle> matteFromString(std::string_view s) {
        for (auto const& [v, n] : kMattes) if (n == s) return v;
        return std::nullopt;
    }

    std::optional<PhotoFilter> filterFromString(std::string_view s) {
        for (auto const& [v, n] : kFilters) if (n == s) return v;
        return std::nullopt;
    }

    std::optional<ArtPiece> parseArtPiece(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;
        ArtPiece p;
        p.id = firstString(j, { "content_id", "contentId", "id" });
        if (p.id.empty()) return std::nullopt;
        p.title = firstString(j, { "title", "name", "content_name" });
        if (p.title.empty()) p.title = p.id;

        auto cat = firstString(j, { "category", "category_id" });
        if (cat.find("store") != std::string::npos || cat.find("purchase") != std::string::npos)
            p.category = ArtCategory::Purchased;
        else if (cat.find("my") != std::string::npos)
            p.category = ArtCategory::Uploaded;

        p.imageType = firstString(j, { "image_type", "file_type" });
        p.matte = matteFromString(firstString(j, { "matte_id", "matte" }));
        p.filter = filterFromString(firstString(j, { "filter_id", "filter" }));
        p.imageDate = firstString(j, { "image_date" });
        if (auto it = j.find("file_size"); it != j.end()) {
            if (it->is_number_unsigned()) p.fileSize = it->get<uint64_t>();
            else if (it->is_string()) {
                try { p.fileSize = std::stoull(it->get<std::string>()); }
                catch (const std::exception&) { p.fileSize.reset(); }
            }
        }
        return p;
    }

    void validateImage(const std::vector<uint8_t>& bytes, ImageType declared) {
        if (bytes.empty()) throw ValidationError("image is empty");
        if (bytes.size() > kMaxImageBytes)
            throw ValidationError(std::format("image is {} bytes, limit is {}", bytes.size(), kMaxImageBytes));

        bool jpeg = bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF;
        bool png  = bytes.size() >= 4 && bytes[0] == 0x89 && bytes[1] == 0x50 && bytes[2] == 0x4E && bytes[3] == 0x47;
        if (declared == ImageType::Jpeg && !jpeg) throw ValidationError("payload is not a JPEG image");
        if (declared == ImageType::Png && !png)   throw ValidationError("payload is not a PNG image");
    }

}
