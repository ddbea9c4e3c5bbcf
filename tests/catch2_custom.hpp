#pragma once

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/common/expected.hpp>
#include <hdlgrader/grading_session.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <filesystem>
#include <string>
#include <string_view>

#include <unistd.h>

// If this is included after Catch2, then instantiations of the stringify function template will
// be choosen over ours
#if defined(CATCH_TOSTRING_HPP_INCLUDED)
#error "Include this file before Catch2"
#else
// Hacky way of overriding the stringification behavior for types Catch2 explicitly specializes
// String formatting without being able to see non-graphical chars is VERY annoying
namespace Catch::Detail {

inline std::string stringify(std::string_view e) {
    return fmt::format("{:?}", e);
}

inline std::string stringify(const std::string& e) {
    return fmt::format("{:?}", e);
}

inline std::string stringify(const char* e) {
    return fmt::format("{:?}", e);
}

} // namespace Catch::Detail
#endif

#include <catch2/catch_all.hpp>         // IWYU pragma: export
#include <catch2/catch_test_macros.hpp> // IWYU pragma: export
#include <catch2/catch_tostring.hpp>
#include <catch2/matchers/catch_matchers_all.hpp> // IWYU pragma: export

namespace Catch {

// Domain enums and Expected print through fmt rather than as raw integers
template <typename T>
    requires(fmt::is_formattable<T>::value && !is_range<T>::value && !Catch::Detail::IsStreamInsertable<T>::value)
struct StringMaker<T>
{
    static std::string convert(const T& t) { return fmt::format("{}", t); }
};

} // namespace Catch

/// Fresh, empty directory under the system temp dir, removed again when the test ends
class TempDir
{
public:
    explicit TempDir(std::string_view tag)
        : path_{std::filesystem::temp_directory_path() /
                fmt::format("hdlgrader-test-{}-{}-{}", tag, ::getpid(), ++counter())} {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code err;
        std::filesystem::remove_all(path_, err);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

    std::filesystem::path operator/(std::string_view rel) const { return path_ / rel; }

private:
    static unsigned& counter() {
        static unsigned count = 0;
        return count;
    }

    std::filesystem::path path_;
};

void write_file(const std::filesystem::path& path, std::string_view contents);

std::string read_file(const std::filesystem::path& path);
