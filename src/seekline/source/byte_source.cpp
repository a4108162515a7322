#include <seekline/source/byte_source.h>

namespace seekline {

std::size_t ByteSource::read_at(std::uint64_t offset, char *buffer,
                                std::size_t size) {
    seek(offset);
    std::size_t total = 0;
    while (total < size) {
        std::size_t n = read(buffer + total, size - total);
        if (n == 0) {
            break;
        }
        total += n;
    }
    return total;
}

}  // namespace seekline
