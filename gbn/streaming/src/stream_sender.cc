// IRON: iron_headers
/*
 * Distribution A
 *
 * Approved for Public Release, Distribution Unlimited
 *
 * EdgeCT (IRON) Software Contract No.: HR0011-15-C-0097
 * DCOMP (GNAT)  Software Contract No.: HR0011-17-C-0050
 * Copyright (c) 2015-20 Raytheon BBN Technologies Corp.
 *
 * This material is based upon work supported by the Defense Advanced
 * Research Projects Agency under Contracts No. HR0011-15-C-0097 and
 * HR0011-17-C-0050. Any opinions, findings and conclusions or
 * recommendations expressed in this material are those of the author(s)
 * and do not necessarily reflect the views of the Defense Advanced
 * Research Project Agency.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
/* IRON: end */

/// \brief The GbnStream stream sender source file.

#include "stream_sender.h"

#include "chunk_header.h"
#include "log.h"
#include "unused.h"

#include <inttypes.h>

using ::gbn::ChunkHeader;
using ::gbn::ConfigInfo;
using ::gbn::GbnSender;
using ::gbn::SendStatus;
using ::gbn::StreamSender;
using ::gbn::Time;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*     UNUSED(kClassName)      = "StreamSender";

  /// The default largest GBN payload.
  const uint32_t  kDefaultMaxPacketSize   = 1400;

  /// The default frame rate.
  const double    kDefaultFps             = 30.0;

  /// The largest number of chunks in a frame.
  const size_t    kMaxChunksPerFrame      = 0xFFFF;
}

//============================================================================
StreamSender::StreamSender(GbnSender& sender)
    : sender_(sender),
      max_chunk_data_size_(kDefaultMaxPacketSize - kChunkHeaderSize),
      frame_interval_(1.0 / kDefaultFps),
      next_frame_id_(0),
      chunks_sent_(0),
      chunk_()
{
}

//============================================================================
StreamSender::~StreamSender()
{
}

//============================================================================
bool StreamSender::Initialize(const ConfigInfo& ci)
{
  uint32_t  max_packet_size = ci.GetUint("Stream.MaxPacketSize",
                                         kDefaultMaxPacketSize);
  double    fps             = ci.GetDouble("Stream.Fps", kDefaultFps);

  return Configure(max_packet_size, fps);
}

//============================================================================
bool StreamSender::Configure(size_t max_packet_size, double fps)
{
  if ((max_packet_size <= kChunkHeaderSize) ||
      (max_packet_size > kMaxGbnPayloadSize))
  {
    LogE(kClassName, __func__, "Invalid maximum packet size %zu, must be "
         "%zu to %zu.\n", max_packet_size, (kChunkHeaderSize + 1),
         kMaxGbnPayloadSize);
    return false;
  }

  if (!(fps > 0.0))
  {
    LogE(kClassName, __func__, "Invalid frame rate %f.\n", fps);
    return false;
  }

  max_chunk_data_size_ = max_packet_size - kChunkHeaderSize;
  frame_interval_      = Time(1.0 / fps);

  return true;
}

//============================================================================
SendStatus StreamSender::SendFrame(const vector<uint8_t>& frame)
{
  if (frame.empty())
  {
    LogW(kClassName, __func__, "Skipping empty frame.\n");
    return SEND_OK;
  }

  size_t  total_chunks = ((frame.size() + max_chunk_data_size_ - 1) /
                          max_chunk_data_size_);

  if (total_chunks > kMaxChunksPerFrame)
  {
    LogE(kClassName, __func__, "Frame of %zu bytes needs %zu chunks, more "
         "than %zu.\n", frame.size(), total_chunks, kMaxChunksPerFrame);
    return SEND_ERROR;
  }

  for (size_t idx = 0; idx < total_chunks; ++idx)
  {
    size_t  offset = idx * max_chunk_data_size_;
    size_t  len    = frame.size() - offset;

    if (len > max_chunk_data_size_)
    {
      len = max_chunk_data_size_;
    }

    ChunkHeader  hdr(next_frame_id_, static_cast<uint16_t>(idx),
                     static_cast<uint16_t>(total_chunks));

    hdr.Serialize(&frame[offset], len, chunk_);

    SendStatus  rv = sender_.Send(&chunk_[0], chunk_.size());

    if (rv != SEND_OK)
    {
      LogW(kClassName, __func__, "Send of chunk %s failed: %s\n",
           hdr.ToString().c_str(), SendStatusToString(rv));
      return rv;
    }

    ++chunks_sent_;
  }

  LogD(kClassName, __func__, "Sent frame %" PRIu32 ", %zu bytes in %zu "
       "chunks.\n", next_frame_id_, frame.size(), total_chunks);

  ++next_frame_id_;

  return SEND_OK;
}

//============================================================================
SendStatus StreamSender::SendEndOfStream()
{
  ChunkHeader::EndOfStream().Serialize(NULL, 0, chunk_);

  SendStatus  rv = sender_.Send(&chunk_[0], chunk_.size());

  if (rv == SEND_OK)
  {
    ++chunks_sent_;

    LogI(kClassName, __func__, "Sent end of stream after %" PRIu32
         " frames.\n", next_frame_id_);
  }
  else
  {
    LogW(kClassName, __func__, "Send of end of stream failed: %s\n",
         SendStatusToString(rv));
  }

  return rv;
}
