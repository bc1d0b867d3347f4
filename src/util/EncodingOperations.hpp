/******************************************************************************
 * @brief Defines and implements functions related to text encodings used on the
 *      wire. All functions are defined within the encodeops namespace.
 *
 * @file EncodingOperations.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef ENCODING_OPERATIONS_HPP
#define ENCODING_OPERATIONS_HPP

/// \cond
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief Namespace containing functions related to encoding and decoding of
 *      binary payloads carried inside text messages.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-29
 ******************************************************************************/
namespace encodeops
{
    /******************************************************************************
     * @brief Decodes a standard RFC 4648 base64 string. Whitespace (line breaks
     *      inserted by some encoders) is skipped. Padding is optional, but
     *      anything after the first '=' other than more padding is rejected.
     *
     * @param szEncoded - The base64 text.
     * @return std::optional<std::vector<uint8_t>> - The decoded bytes, nullopt if
     *      the text is not valid base64.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline std::optional<std::vector<uint8_t>> Base64Decode(std::string_view szEncoded)
    {
        // Build the reverse lookup once. 0xFF marks invalid characters.
        static const std::array<uint8_t, 256> aDecodeTable = []()
        {
            std::array<uint8_t, 256> aTable{};
            aTable.fill(0xFF);
            const char* pAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
            for (uint8_t unI = 0; unI < 64; ++unI)
            {
                aTable[static_cast<uint8_t>(pAlphabet[unI])] = unI;
            }
            return aTable;
        }();

        std::vector<uint8_t> vDecoded;
        vDecoded.reserve(szEncoded.size() * 3 / 4);

        uint32_t unAccumulator = 0;
        int nBitsHeld          = 0;
        int nSextets           = 0;
        int nPadding           = 0;

        for (char chCharacter : szEncoded)
        {
            if (chCharacter == ' ' || chCharacter == '\n' || chCharacter == '\r' || chCharacter == '\t')
            {
                continue;
            }

            if (chCharacter == '=')
            {
                ++nPadding;
                continue;
            }

            // Data after padding is malformed.
            if (nPadding > 0)
            {
                return std::nullopt;
            }

            uint8_t unValue = aDecodeTable[static_cast<uint8_t>(chCharacter)];
            if (unValue == 0xFF)
            {
                return std::nullopt;
            }

            unAccumulator = (unAccumulator << 6) | unValue;
            nBitsHeld += 6;
            ++nSextets;
            if (nBitsHeld >= 8)
            {
                nBitsHeld -= 8;
                vDecoded.push_back(static_cast<uint8_t>((unAccumulator >> nBitsHeld) & 0xFF));
            }
        }

        // A single leftover sextet can't encode a byte, and padding never exceeds two.
        if (nSextets % 4 == 1 || nPadding > 2 || (nPadding > 0 && (nSextets + nPadding) % 4 != 0))
        {
            return std::nullopt;
        }

        return vDecoded;
    }

    /******************************************************************************
     * @brief Encodes bytes as padded RFC 4648 base64.
     *
     * @param vBytes - The bytes to encode.
     * @return std::string - The base64 text, no line breaks.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-29
     ******************************************************************************/
    inline std::string Base64Encode(const std::vector<uint8_t>& vBytes)
    {
        static const char* pAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        std::string szEncoded;
        szEncoded.reserve((vBytes.size() + 2) / 3 * 4);

        size_t siI = 0;
        for (; siI + 2 < vBytes.size(); siI += 3)
        {
            uint32_t unTriple = (static_cast<uint32_t>(vBytes[siI]) << 16) | (static_cast<uint32_t>(vBytes[siI + 1]) << 8) | vBytes[siI + 2];
            szEncoded += pAlphabet[(unTriple >> 18) & 0x3F];
            szEncoded += pAlphabet[(unTriple >> 12) & 0x3F];
            szEncoded += pAlphabet[(unTriple >> 6) & 0x3F];
            szEncoded += pAlphabet[unTriple & 0x3F];
        }

        // One or two trailing bytes.
        size_t siRemaining = vBytes.size() - siI;
        if (siRemaining > 0)
        {
            uint32_t unTriple = static_cast<uint32_t>(vBytes[siI]) << 16;
            if (siRemaining == 2)
            {
                unTriple |= static_cast<uint32_t>(vBytes[siI + 1]) << 8;
            }
            szEncoded += pAlphabet[(unTriple >> 18) & 0x3F];
            szEncoded += pAlphabet[(unTriple >> 12) & 0x3F];
            szEncoded += siRemaining == 2 ? pAlphabet[(unTriple >> 6) & 0x3F] : '=';
            szEncoded += '=';
        }

        return szEncoded;
    }
}    // namespace encodeops

#endif    // ENCODING_OPERATIONS_HPP
