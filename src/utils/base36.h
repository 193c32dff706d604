#ifndef BASE36_H
#define BASE36_H

#include <string>
#include <vector>
#include <stdexcept>

/**
 * @brief Multibase base36 ("k" prefix, lowercase alphabet 0-9a-z).
 *
 * libp2p's MultibaseCodec covers base16/32/58/64 only; IPNS key names are printed in base36,
 * so that one encoding lives here.
 */
namespace Base36 {

    using Bytes = std::vector<unsigned char>;

    /**
     * @brief Raised on malformed base36 input.
     */
    class FormatError : public std::runtime_error {
    public:
        explicit FormatError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // Multibase prefix for lowercase base36
    constexpr char MULTIBASE_PREFIX = 'k';

    // Leading zero bytes map to '0'
    std::string encode(const Bytes& data);

    /**
     * @brief Decodes base36 text. Upper- and lowercase letters are both accepted.
     * @throws FormatError on characters outside the alphabet.
     */
    Bytes decode(const std::string& text);

    std::string encodeMultibase(const Bytes& data);

    /**
     * @brief Decodes a multibase string that must carry the base36 prefix ('k' or 'K').
     * @throws FormatError for any other prefix or empty input.
     */
    Bytes decodeMultibase(const std::string& text);

} // namespace Base36

#endif // BASE36_H
