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

/// \brief The GbnStream chunk header file.
///
/// Provides the codec for the application header that prefixes every chunk
/// of an encoded frame inside a GBN payload.

#ifndef GBN_STREAMING_CHUNK_HEADER_H
#define GBN_STREAMING_CHUNK_HEADER_H

#include <string>
#include <vector>

#include <stddef.h>
#include <stdint.h>

namespace gbn
{

  /// The size of the chunk header: a 32-bit frame id, a 16-bit chunk index
  /// and a 16-bit chunk count, all in network byte order.
  const size_t    kChunkHeaderSize  = 8;

  /// The frame id of the end-of-stream sentinel.
  const uint32_t  kEosFrameId       = 0xFFFFFFFF;

  /// The chunk count of the end-of-stream sentinel.
  const uint16_t  kEosTotalChunks   = 0xFFFF;

  /// \brief The chunk application header.
  struct ChunkHeader
  {
    ChunkHeader() : frame_id(0), chunk_idx(0), total_chunks(0)
    { }

    ChunkHeader(uint32_t fid, uint16_t idx, uint16_t total)
        : frame_id(fid), chunk_idx(idx), total_chunks(total)
    { }

    /// \brief Get the end-of-stream sentinel header.
    static ChunkHeader EndOfStream()
    {
      return ChunkHeader(kEosFrameId, 0, kEosTotalChunks);
    }

    /// \brief Check if this is the end-of-stream sentinel.
    ///
    /// The chunk index is not examined.
    inline bool IsEndOfStream() const
    {
      return ((frame_id == kEosFrameId) && (total_chunks == kEosTotalChunks));
    }

    /// \brief Append the header and a chunk to a buffer.
    ///
    /// \param  data  The chunk bytes.  May be NULL if len is 0.
    /// \param  len   The chunk length.
    /// \param  out   The buffer.  Replaced.
    void Serialize(const uint8_t* data, size_t len,
                   std::vector<uint8_t>& out) const;

    /// \brief Parse a header from the front of a payload.
    ///
    /// \param  buf       The payload bytes.
    /// \param  len       The payload length.
    /// \param  data_off  Set to the offset of the chunk bytes.
    ///
    /// \return  True on success, false if the payload is shorter than the
    ///          header.
    bool Parse(const uint8_t* buf, size_t len, size_t& data_off);

    /// \brief Get a string representation of the header.
    std::string ToString() const;

    /// The frame id.
    uint32_t  frame_id;

    /// The index of this chunk within the frame.
    uint16_t  chunk_idx;

    /// The number of chunks in the frame.
    uint16_t  total_chunks;

  }; // end struct ChunkHeader

} // namespace gbn

#endif // GBN_STREAMING_CHUNK_HEADER_H
