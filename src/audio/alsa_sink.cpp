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

#include "audio/alsa_sink.h"

#include <errno.h>
#include <stdio.h>

#include <new>

#include "alsa_pcm.h"
#include "logging_common.h"

struct alsa_sink {
   char device[CONFIG_DEVICE_MAX];
   unsigned int sample_rate;
   unsigned int channels;
   unsigned int chunk_bytes;
   snd_pcm_t *handle;
};

namespace {

size_t frame_bytes(const alsa_sink_t *s) {
   return 2u * s->channels;
}

int op_start(void *ctx) {
   alsa_sink_t *s = static_cast<alsa_sink_t *>(ctx);
   if (s->handle)
      return snd_pcm_prepare(s->handle) < 0 ? 1 : 0;

   snd_pcm_uframes_t period = s->chunk_bytes / frame_bytes(s);
   return alsa_pcm_open(&s->handle, s->device, SND_PCM_STREAM_PLAYBACK, s->sample_rate,
                        s->channels, period);
}

void op_stop(void *ctx) {
   alsa_sink_t *s = static_cast<alsa_sink_t *>(ctx);
   if (!s->handle)
      return;

   /* Drop (not drain) so barge-in silences the speaker immediately */
   snd_pcm_drop(s->handle);
   snd_pcm_prepare(s->handle);
}

int op_write(void *ctx, const uint8_t *data, size_t len) {
   alsa_sink_t *s = static_cast<alsa_sink_t *>(ctx);
   if (!s->handle)
      return SINK_ERR_IO;

   snd_pcm_uframes_t frames = len / frame_bytes(s);
   if (frames == 0)
      return SINK_SUCCESS;

   snd_pcm_sframes_t avail = snd_pcm_avail_update(s->handle);
   if (avail < 0) {
      int rc = snd_pcm_recover(s->handle, static_cast<int>(avail), 1);
      if (rc < 0) {
         PARLEY_LOG_ERROR("ALSA: playback recovery failed: %s", snd_strerror(rc));
         return SINK_ERR_IO;
      }
      return SINK_ERR_BUSY;
   }
   if (static_cast<snd_pcm_uframes_t>(avail) < frames)
      return SINK_ERR_BUSY;

   snd_pcm_sframes_t written = snd_pcm_writei(s->handle, data, frames);
   if (written == -EAGAIN)
      return SINK_ERR_BUSY;

   if (written == -EPIPE) {
      PARLEY_LOG_WARNING("ALSA: playback underrun");
      snd_pcm_prepare(s->handle);
      written = snd_pcm_writei(s->handle, data, frames);
   }
   if (written < 0) {
      PARLEY_LOG_ERROR("ALSA: playback write error: %s", snd_strerror(static_cast<int>(written)));
      snd_pcm_recover(s->handle, static_cast<int>(written), 1);
      return SINK_ERR_IO;
   }
   if (static_cast<snd_pcm_uframes_t>(written) < frames)
      PARLEY_LOG_WARNING("ALSA: short playback write (%ld of %lu frames)",
                         static_cast<long>(written), static_cast<unsigned long>(frames));
   return SINK_SUCCESS;
}

}  // namespace

extern "C" {

alsa_sink_t *alsa_sink_create(const parley_config_t *config) {
   if (!config || config->audio.channels == 0)
      return NULL;

   alsa_sink_t *s = new (std::nothrow) alsa_sink_t();
   if (!s)
      return NULL;

   snprintf(s->device, sizeof(s->device), "%s", config->audio.playback_device);
   s->sample_rate = config->audio.sample_rate;
   s->channels = config->audio.channels;
   s->chunk_bytes = config->audio.chunk_bytes;
   return s;
}

void alsa_sink_destroy(alsa_sink_t *sink) {
   if (!sink)
      return;

   if (sink->handle) {
      snd_pcm_drop(sink->handle);
      snd_pcm_close(sink->handle);
   }
   delete sink;
}

void alsa_sink_bind(alsa_sink_t *sink, session_sink_t *out) {
   if (!out)
      return;

   out->ctx = sink;
   out->start = op_start;
   out->stop = op_stop;
   out->write = op_write;
}

} /* extern "C" */
