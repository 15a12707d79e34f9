#ifndef TITLECASE_IO_HPP
#define TITLECASE_IO_HPP

#include <cstddef>
#include <cstdio>
#include <cstring>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "titlecase/util/function_ref.hpp"
#include "titlecase/util/result.hpp"

#include "titlecase/fwd.hpp"

namespace titlecase {

enum struct IO_Error_Code : Default_Underlying {
    /// @brief The file couldn't be opened.
    /// This may be due to disk errors, security issues, bad file paths, or other issues.
    cannot_open,
    /// @brief An error occurred while reading a file.
    read_error,
    /// @brief The file is not properly encoded.
    /// For example, if an attempt is made to read a text file as UTF-8 that is not encoded as such.
    corrupted,
};

[[nodiscard]]
constexpr std::u8string_view io_error_code_message(IO_Error_Code code)
{
    switch (code) {
    case IO_Error_Code::cannot_open: return u8"The file could not be opened.";
    case IO_Error_Code::read_error: return u8"An error occurred while reading the file.";
    case IO_Error_Code::corrupted: return u8"The file is not valid UTF-8.";
    }
    return u8"";
}

struct [[nodiscard]] Unique_File {
private:
    std::FILE* m_file = nullptr;

public:
    constexpr Unique_File() = default;

    constexpr Unique_File(std::FILE* f)
        : m_file { f }
    {
    }

    constexpr Unique_File(Unique_File&& other) noexcept
        : m_file { std::exchange(other.m_file, nullptr) }
    {
    }

    Unique_File(const Unique_File&) = delete;
    Unique_File& operator=(const Unique_File&) = delete;

    constexpr Unique_File& operator=(Unique_File&& other) noexcept
    {
        swap(*this, other);
        other.close();
        return *this;
    }

    constexpr friend void swap(Unique_File& x, Unique_File& y) noexcept
    {
        std::swap(x.m_file, y.m_file);
    }

    void close() noexcept
    {
        if (m_file) {
            std::fclose(m_file);
            m_file = nullptr;
        }
    }

    [[nodiscard]]
    constexpr std::FILE* get() const noexcept
    {
        return m_file;
    }

    [[nodiscard]]
    constexpr operator bool() const noexcept
    {
        return m_file != nullptr;
    }

    ~Unique_File()
    {
        close();
    }
};

/// @brief Forwards the arguments to `std::fopen` and wraps the result in `Unique_File`.
[[nodiscard]]
inline Unique_File fopen_unique(const char* path, const char* mode) noexcept
{
    return std::fopen(path, mode);
}

/// @brief Reads all bytes from a file and calls a given consumer with them, chunk by chunk.
/// @param consume_chunk Invoked repeatedly with temporary chunks of bytes.
/// The chunks may be located within the same underlying buffer,
/// so they should not be used after `consume_chunk` has been invoked.
/// @param path the file path
[[nodiscard]]
Result<void, IO_Error_Code> file_to_bytes_chunked(
    Function_Ref<void(std::span<const std::byte>)> consume_chunk,
    std::u8string_view path
);

/// @brief Reads all bytes from a file, appends them to `out`,
/// and checks that the appended bytes are valid UTF-8.
[[nodiscard]]
Result<void, IO_Error_Code> load_utf8_file(std::vector<char8_t>& out, std::u8string_view path);

} // namespace titlecase

#endif
