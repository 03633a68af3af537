/*
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * By contributing to this project, you agree to license your contributions
 * under the GPLv3 (or any later version) or any future licenses chosen by
 * the project author(s). Contributions include any modifications,
 * enhancements, or additions to the project. These contributions become
 * part of the project and are adopted by the project author(s).
 *
 * Base64 (RFC 4648, standard alphabet) into caller-provided buffers
 */

#ifndef PARLEY_BASE64_H
#define PARLEY_BASE64_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Encoded length of len input bytes, without the terminating NUL
 */
size_t parley_base64_encoded_len(size_t len);

/**
 * @brief Upper bound of the decoded length of in_len encoded characters
 */
size_t parley_base64_decoded_max(size_t in_len);

/**
 * @brief Encode binary data as a NUL-terminated base64 string
 *
 * @param in Input bytes
 * @param len Input length
 * @param out Output buffer (parley_base64_encoded_len(len) + 1 bytes)
 * @param out_size Output buffer size
 * @param out_len Receives the encoded length (can be NULL)
 * @return 0 on success, 1 on bad arguments or a short buffer
 */
int parley_base64_encode(const uint8_t *in,
                         size_t len,
                         char *out,
                         size_t out_size,
                         size_t *out_len);

/**
 * @brief Decode base64 text
 *
 * Whitespace is skipped. Padding is optional, but nothing may follow it.
 *
 * @param in Encoded text
 * @param in_len Text length
 * @param out Output buffer
 * @param out_size Output buffer size
 * @param out_len Receives the decoded length
 * @return 0 on success, 1 on invalid input or a short buffer
 */
int parley_base64_decode(const char *in,
                         size_t in_len,
                         uint8_t *out,
                         size_t out_size,
                         size_t *out_len);

#ifdef __cplusplus
}
#endif

#endif /* PARLEY_BASE64_H */
