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

#include <cppunit/extensions/HelperMacros.h>

#include "chunk_header.h"

#include <vector>

using ::gbn::ChunkHeader;
using ::std::vector;

//============================================================================
class ChunkHeaderTest : public CppUnit::TestFixture
{
  CPPUNIT_TEST_SUITE(ChunkHeaderTest);

  CPPUNIT_TEST(TestLayout);
  CPPUNIT_TEST(TestParse);
  CPPUNIT_TEST(TestEndOfStream);
  CPPUNIT_TEST(TestTooShort);

  CPPUNIT_TEST_SUITE_END();

 public:

  //==========================================================================
  void TestLayout()
  {
    ChunkHeader      hdr(0x01020304, 0x0506, 0x0708);
    uint8_t          data[3] = { 0xaa, 0xbb, 0xcc };
    vector<uint8_t>  out;

    hdr.Serialize(data, sizeof(data), out);

    CPPUNIT_ASSERT(out.size() == (gbn::kChunkHeaderSize + 3));

    // Big-endian frame id, chunk index and chunk count.
    for (uint8_t i = 0; i < 8; ++i)
    {
      CPPUNIT_ASSERT(out[i] == (i + 1));
    }

    CPPUNIT_ASSERT(out[8] == 0xaa);
    CPPUNIT_ASSERT(out[10] == 0xcc);
  }

  //==========================================================================
  void TestParse()
  {
    uint8_t      buf[10] = { 0x00, 0x00, 0x01, 0x00, 0x00, 0x02, 0x00, 0x03,
                             0x11, 0x22 };
    ChunkHeader  hdr;
    size_t       data_off = 0;

    CPPUNIT_ASSERT(hdr.Parse(buf, sizeof(buf), data_off));
    CPPUNIT_ASSERT(hdr.frame_id == 256);
    CPPUNIT_ASSERT(hdr.chunk_idx == 2);
    CPPUNIT_ASSERT(hdr.total_chunks == 3);
    CPPUNIT_ASSERT(data_off == 8);
    CPPUNIT_ASSERT(!hdr.IsEndOfStream());
    CPPUNIT_ASSERT(hdr.ToString() == "frame 256 chunk 2/3");
  }

  //==========================================================================
  void TestEndOfStream()
  {
    vector<uint8_t>  out;

    ChunkHeader::EndOfStream().Serialize(NULL, 0, out);

    CPPUNIT_ASSERT(out.size() == gbn::kChunkHeaderSize);

    uint8_t  expected[8] = { 0xff, 0xff, 0xff, 0xff, 0x00, 0x00, 0xff, 0xff };

    for (size_t i = 0; i < sizeof(expected); ++i)
    {
      CPPUNIT_ASSERT(out[i] == expected[i]);
    }

    ChunkHeader  hdr;
    size_t       data_off = 0;

    CPPUNIT_ASSERT(hdr.Parse(&out[0], out.size(), data_off));
    CPPUNIT_ASSERT(hdr.IsEndOfStream());
    CPPUNIT_ASSERT(hdr.ToString() == "EOS");

    // The frame id alone does not make a sentinel.
    ChunkHeader  not_eos(gbn::kEosFrameId, 0, 1);

    CPPUNIT_ASSERT(!not_eos.IsEndOfStream());
  }

  //==========================================================================
  void TestTooShort()
  {
    uint8_t      buf[7] = { 0 };
    ChunkHeader  hdr;
    size_t       data_off = 0;

    CPPUNIT_ASSERT(!hdr.Parse(buf, sizeof(buf), data_off));
    CPPUNIT_ASSERT(!hdr.Parse(NULL, 8, data_off));
  }
};

CPPUNIT_TEST_SUITE_REGISTRATION(ChunkHeaderTest);
