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

#include "session/silence_detector.h"

#include <string.h>

extern "C" {

void silence_detector_init(silence_detector_t *det,
                           int threshold,
                           uint32_t duration_ms,
                           unsigned int sample_rate,
                           unsigned int channels) {
   if (!det)
      return;

   memset(det, 0, sizeof(*det));
   det->threshold = threshold;
   det->duration_ms = duration_ms;
   det->sample_rate = sample_rate;
   det->channels = channels ? channels : 1;
}

void silence_detector_reset(silence_detector_t *det) {
   if (!det)
      return;
   det->had_voice = false;
   det->silence_ms = 0;
}

int silence_detector_level(const uint8_t *pcm, size_t len) {
   size_t samples = len / 2;
   if (!pcm || samples == 0)
      return 0;

   uint64_t sum = 0;
   for (size_t i = 0; i < samples; i++) {
      int16_t s = static_cast<int16_t>(static_cast<uint16_t>(pcm[2 * i] | (pcm[2 * i + 1] << 8)));
      sum += static_cast<uint64_t>(s < 0 ? -static_cast<int32_t>(s) : static_cast<int32_t>(s));
   }
   return static_cast<int>(sum / samples);
}

bool silence_detector_process(silence_detector_t *det, const uint8_t *pcm, size_t len) {
   if (!det || !pcm || len < 2 || det->sample_rate == 0)
      return false;

   int level = silence_detector_level(pcm, len);
   if (level > det->threshold) {
      det->had_voice = true;
      det->silence_ms = 0;
      return false;
   }

   if (!det->had_voice)
      return false;

   /* Chunk duration from its frame count */
   uint64_t frames = (len / 2) / det->channels;
   det->silence_ms += static_cast<uint32_t>((frames * 1000u) / det->sample_rate);

   return det->silence_ms >= det->duration_ms;
}

} /* extern "C" */
