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

/// \brief The GbnStream in-memory frame source source file.

#include "vector_frame_source.h"

using ::gbn::VectorFrameSource;
using ::std::vector;

//============================================================================
VectorFrameSource::VectorFrameSource()
    : frames_(), next_(0)
{
}

//============================================================================
VectorFrameSource::VectorFrameSource(size_t num_frames, size_t base_size,
                                     size_t step)
    : frames_(), next_(0)
{
  for (size_t i = 0; i < num_frames; ++i)
  {
    vector<uint8_t>  frame(base_size + (i * step));

    for (size_t j = 0; j < frame.size(); ++j)
    {
      frame[j] = static_cast<uint8_t>((i + j) & 0xff);
    }

    frames_.push_back(frame);
  }
}

//============================================================================
VectorFrameSource::~VectorFrameSource()
{
}

//============================================================================
void VectorFrameSource::AddFrame(const vector<uint8_t>& frame)
{
  frames_.push_back(frame);
}

//============================================================================
bool VectorFrameSource::NextFrame(vector<uint8_t>& frame)
{
  if (next_ >= frames_.size())
  {
    frame.clear();
    return false;
  }

  frame = frames_[next_];
  ++next_;

  return true;
}
