/**
 * @file art_types.hpp
 * @brief Picture-frame content model.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace framectl {

    enum class ImageType { Jpeg, Png };

    enum class ArtCategory { Preloaded, Purchased, Uploaded };

    enum class MatteStyle {
        None,
        ModernBeige, ModernApricot, ModernIvory, ModernBrown, ModernWalnut,
        VintageWhite, VintageBeige, VintageWalnut
    };

    enum class PhotoFilter { None, Ink, Watercolor, Pencil, Pastel, Comic, OilPainting };

    inline constexpr std::size_t kMaxImageBytes = 20 * 1024 * 1024;

    std::string_view toString(ImageType t);         ///< "jpg" / "png"
    std::string_view mimeType(ImageType t);         ///< "image/jpeg" / "image/png"
    std::string_view toString(ArtCategory c);
    std::string_view toString(MatteStyle m);        ///< wire id, e.g. "modern_beige"
    std::string_view toString(PhotoFilter f);       ///< wire id, e.g. "oil_painting"
    std::optional<MatteStyle> matteFromString(std::string_view s);
    std::optional<PhotoFilter> filterFromString(std::string_view s);

    /**
     * @struct ArtPiece
     * @brief One item of the television's art collection.
     */
    struct ArtPiece {
        std::string                 id;
        std::string                 title;
        ArtCategory                 category{ ArtCategory::Preloaded };
        std::string                 imageType;
        std::optional<MatteStyle>   matte;
        std::optional<PhotoFilter>  filter;
        std::string                 imageDate;
        std::optional<uint64_t>     fileSize;
    };

    /**
     * @brief Decode one content entry; std::nullopt if it has no id.
     *
     * Accepts content_id/contentId/id and title/name/content_name. category
     * "store"/"purchase" is Purchased, "my" is Uploaded, anything else Preloaded.
     */
    std::optional<ArtPiece> parseArtPiece(const nlohmann::json& j);

    /**
     * @brief Check an image payload before upload.
     * @throws ValidationError if empty, larger than kMaxImageBytes, or not the declared format
     */
    void validateImage(const std::vector<uint8_t>& bytes, ImageType declared);

}
