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

#include "audio/alsa_capture.h"

#include <errno.h>
#include <stdio.h>

#include <new>

#include "alsa_pcm.h"
#include "logging_common.h"

struct alsa_capture {
   char device[CONFIG_DEVICE_MAX];
   unsigned int sample_rate;
   unsigned int channels;
   unsigned int chunk_bytes;
   snd_pcm_t *handle;
};

namespace {

size_t frame_bytes(const alsa_capture_t *c) {
   return 2u * c->channels;
}

int op_start(void *ctx) {
   alsa_capture_t *c = static_cast<alsa_capture_t *>(ctx);
   if (c->handle)
      return 0;

   snd_pcm_uframes_t period = c->chunk_bytes / frame_bytes(c);
   if (alsa_pcm_open(&c->handle, c->device, SND_PCM_STREAM_CAPTURE, c->sample_rate, c->channels,
                     period) != 0) {
      return 1;
   }

   int rc = snd_pcm_start(c->handle);
   if (rc < 0) {
      PARLEY_LOG_ERROR("ALSA: cannot start capture: %s", snd_strerror(rc));
      snd_pcm_close(c->handle);
      c->handle = NULL;
      return 1;
   }
   return 0;
}

void op_stop(void *ctx) {
   alsa_capture_t *c = static_cast<alsa_capture_t *>(ctx);
   if (!c->handle)
      return;

   snd_pcm_drop(c->handle);
   snd_pcm_close(c->handle);
   c->handle = NULL;
}

ssize_t op_read(void *ctx, uint8_t *buf, size_t max_bytes) {
   alsa_capture_t *c = static_cast<alsa_capture_t *>(ctx);
   if (!c->handle)
      return -1;

   snd_pcm_uframes_t frames = max_bytes / frame_bytes(c);
   if (frames == 0)
      return 0;

   snd_pcm_sframes_t got = snd_pcm_readi(c->handle, buf, frames);
   if (got == -EAGAIN)
      return 0;

   if (got < 0) {
      /* Overrun (-EPIPE) or suspend: recover and report no data this round */
      PARLEY_LOG_WARNING("ALSA: capture read error: %s", snd_strerror(static_cast<int>(got)));
      int rc = snd_pcm_recover(c->handle, static_cast<int>(got), 1);
      if (rc < 0) {
         PARLEY_LOG_ERROR("ALSA: capture recovery failed: %s", snd_strerror(rc));
         return -1;
      }
      snd_pcm_start(c->handle);
      return 0;
   }

   return static_cast<ssize_t>(static_cast<size_t>(got) * frame_bytes(c));
}

}  // namespace

extern "C" {

alsa_capture_t *alsa_capture_create(const parley_config_t *config) {
   if (!config || config->audio.channels == 0)
      return NULL;

   alsa_capture_t *c = new (std::nothrow) alsa_capture_t();
   if (!c)
      return NULL;

   snprintf(c->device, sizeof(c->device), "%s", config->audio.capture_device);
   c->sample_rate = config->audio.sample_rate;
   c->channels = config->audio.channels;
   c->chunk_bytes = config->audio.chunk_bytes;
   return c;
}

void alsa_capture_destroy(alsa_capture_t *capture) {
   if (!capture)
      return;

   op_stop(capture);
   delete capture;
}

void alsa_capture_bind(alsa_capture_t *capture, session_capture_t *out) {
   if (!out)
      return;

   out->ctx = capture;
   out->start = op_start;
   out->stop = op_stop;
   out->read = op_read;
}

} /* extern "C" */
