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

/// \brief The GbnStream chunk header source file.

#include "chunk_header.h"

#include "string_utils.h"

#include <cstring>

#include <arpa/inet.h>
#include <inttypes.h>

using ::gbn::ChunkHeader;
using ::gbn::StringUtils;
using ::std::string;
using ::std::vector;

//============================================================================
void ChunkHeader::Serialize(const uint8_t* data, size_t len,
                            vector<uint8_t>& out) const
{
  uint32_t  fid_nbo   = htonl(frame_id);
  uint16_t  idx_nbo   = htons(chunk_idx);
  uint16_t  total_nbo = htons(total_chunks);

  out.resize(kChunkHeaderSize + len);

  memcpy(&out[0], &fid_nbo, sizeof(fid_nbo));
  memcpy(&out[4], &idx_nbo, sizeof(idx_nbo));
  memcpy(&out[6], &total_nbo, sizeof(total_nbo));

  if ((data != NULL) && (len > 0))
  {
    memcpy(&out[kChunkHeaderSize], data, len);
  }
}

//============================================================================
bool ChunkHeader::Parse(const uint8_t* buf, size_t len, size_t& data_off)
{
  if ((buf == NULL) || (len < kChunkHeaderSize))
  {
    return false;
  }

  uint32_t  fid_nbo   = 0;
  uint16_t  idx_nbo   = 0;
  uint16_t  total_nbo = 0;

  memcpy(&fid_nbo, buf, sizeof(fid_nbo));
  memcpy(&idx_nbo, buf + 4, sizeof(idx_nbo));
  memcpy(&total_nbo, buf + 6, sizeof(total_nbo));

  frame_id     = ntohl(fid_nbo);
  chunk_idx    = ntohs(idx_nbo);
  total_chunks = ntohs(total_nbo);
  data_off     = kChunkHeaderSize;

  return true;
}

//============================================================================
string ChunkHeader::ToString() const
{
  if (IsEndOfStream())
  {
    return "EOS";
  }

  return StringUtils::FormatString(64, "frame %" PRIu32 " chunk %" PRIu16
                                   "/%" PRIu16, frame_id, chunk_idx,
                                   total_chunks);
}
