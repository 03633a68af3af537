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
 */

#include "utils/base64.h"

namespace {

const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) {
   if (c >= 'A' && c <= 'Z')
      return c - 'A';
   if (c >= 'a' && c <= 'z')
      return c - 'a' + 26;
   if (c >= '0' && c <= '9')
      return c - '0' + 52;
   if (c == '+')
      return 62;
   if (c == '/')
      return 63;
   return -1;
}

bool is_space(char c) {
   return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

}  // namespace

extern "C" {

size_t parley_base64_encoded_len(size_t len) {
   return ((len + 2) / 3) * 4;
}

size_t parley_base64_decoded_max(size_t in_len) {
   return (in_len / 4) * 3 + 3;
}

int parley_base64_encode(const uint8_t *in,
                         size_t len,
                         char *out,
                         size_t out_size,
                         size_t *out_len) {
   if ((!in && len > 0) || !out)
      return 1;

   size_t needed = parley_base64_encoded_len(len);
   if (out_size < needed + 1)
      return 1;

   size_t o = 0;
   size_t i = 0;
   for (; i + 2 < len; i += 3) {
      uint32_t triple = (static_cast<uint32_t>(in[i]) << 16) |
                        (static_cast<uint32_t>(in[i + 1]) << 8) | in[i + 2];
      out[o++] = kAlphabet[(triple >> 18) & 0x3F];
      out[o++] = kAlphabet[(triple >> 12) & 0x3F];
      out[o++] = kAlphabet[(triple >> 6) & 0x3F];
      out[o++] = kAlphabet[triple & 0x3F];
   }

   size_t rest = len - i;
   if (rest > 0) {
      uint32_t triple = static_cast<uint32_t>(in[i]) << 16;
      if (rest == 2)
         triple |= static_cast<uint32_t>(in[i + 1]) << 8;
      out[o++] = kAlphabet[(triple >> 18) & 0x3F];
      out[o++] = kAlphabet[(triple >> 12) & 0x3F];
      out[o++] = (rest == 2) ? kAlphabet[(triple >> 6) & 0x3F] : '=';
      out[o++] = '=';
   }

   out[o] = '\0';
   if (out_len)
      *out_len = o;
   return 0;
}

int parley_base64_decode(const char *in,
                         size_t in_len,
                         uint8_t *out,
                         size_t out_size,
                         size_t *out_len) {
   if ((!in && in_len > 0) || !out_len || (!out && out_size > 0))
      return 1;

   size_t n = 0;
   uint32_t quad = 0;
   int count = 0;   /* Characters in the current quad */
   int padding = 0; /* '=' seen */

   for (size_t i = 0; i < in_len; i++) {
      char c = in[i];
      if (is_space(c))
         continue;

      int value = 0;
      if (c == '=') {
         if (count < 2)
            return 1;
         padding++;
      } else {
         if (padding > 0)
            return 1;
         value = decode_char(c);
         if (value < 0)
            return 1;
      }

      quad = (quad << 6) | static_cast<uint32_t>(value);
      count++;
      if (count < 4)
         continue;

      size_t bytes = static_cast<size_t>(3 - padding);
      if (n + bytes > out_size)
         return 1;
      out[n++] = static_cast<uint8_t>((quad >> 16) & 0xFF);
      if (bytes > 1)
         out[n++] = static_cast<uint8_t>((quad >> 8) & 0xFF);
      if (bytes > 2)
         out[n++] = static_cast<uint8_t>(quad & 0xFF);
      quad = 0;
      count = 0;
      if (padding > 0)
         padding = 3; /* Closed: any further character is an error */
   }

   if (padding > 0 && count != 0)
      return 1;

   /* Unpadded tail */
   if (count == 1)
      return 1;
   if (count > 1) {
      quad <<= 6 * (4 - count);
      size_t bytes = static_cast<size_t>(count - 1);
      if (n + bytes > out_size)
         return 1;
      out[n++] = static_cast<uint8_t>((quad >> 16) & 0xFF);
      if (bytes > 1)
         out[n++] = static_cast<uint8_t>((quad >> 8) & 0xFF);
   }

   *out_len = n;
   return 0;
}

} /* extern "C" */
