#include <cstddef>
#include <cstdio>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "titlecase/util/function_ref.hpp"
#include "titlecase/util/io.hpp"
#include "titlecase/util/result.hpp"
#include "titlecase/util/unicode.hpp"

#include "titlecase/fwd.hpp"

namespace titlecase {

[[nodiscard]]
Result<void, IO_Error_Code> file_to_bytes_chunked(
    Function_Ref<void(std::span<const std::byte>)> consume_chunk,
    std::u8string_view path
)
{
    constexpr std::size_t block_size = BUFSIZ;
    char buffer[block_size] {};

    const std::string c_path { reinterpret_cast<const char*>(path.data()), path.size() };
    const Unique_File stream = fopen_unique(c_path.c_str(), "rb");
    if (!stream) {
        return IO_Error_Code::cannot_open;
    }

    std::size_t read_size;
    do {
        read_size = std::fread(buffer, 1, block_size, stream.get());
        if (std::ferror(stream.get())) {
            return IO_Error_Code::read_error;
        }
        const std::span<const std::byte> chunk { reinterpret_cast<std::byte*>(buffer), read_size };
        consume_chunk(chunk);
    } while (read_size == block_size);

    return {};
}

Result<void, IO_Error_Code> load_utf8_file(std::vector<char8_t>& out, std::u8string_view path)
{
    const std::size_t initial_size = out.size();
    const Result<void, IO_Error_Code> r = file_to_bytes_chunked(
        [&out](std::span<const std::byte> chunk) -> void {
            if (chunk.empty()) {
                return;
            }
            const std::size_t old_size = out.size();
            out.resize(out.size() + chunk.size());
            std::memcpy(out.data() + old_size, chunk.data(), chunk.size());
        },
        path
    );
    if (!r) {
        return r;
    }
    const std::u8string_view str { out.data() + initial_size, out.size() - initial_size };
    if (!utf8::is_valid(str)) {
        return IO_Error_Code::corrupted;
    }
    return {};
}

} // namespace titlecase
