#include "prism/mesh/CoordinateConversion.hpp"
#include "prism/core/logger.hpp"

#include <charconv>

namespace prism::mesh {

    namespace {
        constexpr std::string_view kLegacyGeneratorPrefix = "UniGLTF-";
        constexpr int kLastLegacyMajor = 1;
        constexpr int kLastLegacyMinor = 16;

        bool parseInt(std::string_view text, int& out)
        {
            if (text.empty()) {
                return false;
            }
            const auto* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(text.data(), end, out);
            return ec == std::errc{} && ptr == end;
        }
    }

    UvConvention resolveUvConvention(std::string_view generator)
    {
        if (!generator.starts_with(kLegacyGeneratorPrefix)) {
            return UvConvention::Current;
        }

        const std::string_view version = generator.substr(kLegacyGeneratorPrefix.size());
        const size_t dot = version.find('.');
        int major = 0;
        int minor = 0;
        if (dot == std::string_view::npos ||
            !parseInt(version.substr(0, dot), major) ||
            !parseInt(version.substr(dot + 1, version.find('.', dot + 1) - (dot + 1)), minor))
        {
            core::Logger::Mesh.warn("Unrecognized generator version '{}', assuming current UV convention.",
                                    generator);
            return UvConvention::Current;
        }

        if (major < kLastLegacyMajor ||
            (major == kLastLegacyMajor && minor <= kLastLegacyMinor))
        {
            return UvConvention::LegacyFlipY;
        }
        return UvConvention::Current;
    }

    std::optional<UvConvention> uvConventionFromName(std::string_view name)
    {
        if (name == "current") {
            return UvConvention::Current;
        }
        if (name == "legacy") {
            return UvConvention::LegacyFlipY;
        }
        return std::nullopt;
    }

    std::optional<AxisInverter> axis::fromName(std::string_view name)
    {
        if (name == "reverseZ") {
            return AxisInverter(axis::reverseZ);
        }
        if (name == "reverseX") {
            return AxisInverter(axis::reverseX);
        }
        if (name == "identity") {
            return AxisInverter(axis::identity);
        }
        return std::nullopt;
    }

}
