/**
 * @file chunk_types.hh
 * @brief Chunk types registered by the PNG specification
 */

#pragma once

#include <pngc/chunk_type.hh>
#include <pngc/export_pngc.h>

namespace pngc {
    namespace chunk_types {
        // Critical chunks
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type PLTE('P', 'L', 'T', 'E');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');

        // Ancillary chunks
        inline constexpr chunk_type cHRM('c', 'H', 'R', 'M');
        inline constexpr chunk_type gAMA('g', 'A', 'M', 'A');
        inline constexpr chunk_type iCCP('i', 'C', 'C', 'P');
        inline constexpr chunk_type sBIT('s', 'B', 'I', 'T');
        inline constexpr chunk_type sRGB('s', 'R', 'G', 'B');
        inline constexpr chunk_type bKGD('b', 'K', 'G', 'D');
        inline constexpr chunk_type hIST('h', 'I', 'S', 'T');
        inline constexpr chunk_type tRNS('t', 'R', 'N', 'S');
        inline constexpr chunk_type pHYs('p', 'H', 'Y', 's');
        inline constexpr chunk_type sPLT('s', 'P', 'L', 'T');
        inline constexpr chunk_type tIME('t', 'I', 'M', 'E');
        inline constexpr chunk_type iTXt('i', 'T', 'X', 't');
        inline constexpr chunk_type tEXt('t', 'E', 'X', 't');
        inline constexpr chunk_type zTXt('z', 'T', 'X', 't');
        inline constexpr chunk_type eXIf('e', 'X', 'I', 'f');
    }

    /**
     * @brief Check whether a chunk type is one of the registered PNG types
     * @param type Chunk type to look up
     * @return True for the types listed in pngc::chunk_types
     *
     * Application-defined chunks (such as private "ruSt" chunks) return false.
     */
    PNGC_EXPORT bool is_standard(const chunk_type& type) noexcept;

} // namespace pngc
