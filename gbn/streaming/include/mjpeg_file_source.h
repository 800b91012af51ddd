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

/// \brief The GbnStream Motion JPEG file source header file.

#ifndef GBN_STREAMING_MJPEG_FILE_SOURCE_H
#define GBN_STREAMING_MJPEG_FILE_SOURCE_H

#include "frame_source.h"

#include <string>
#include <vector>

#include <stdint.h>
#include <stdio.h>

namespace gbn
{

  /// \brief A frame source reading a file of concatenated JPEG images.
  ///
  /// Each frame runs from a start-of-image marker (0xFFD8) to the following
  /// end-of-image marker (0xFFD9), both included.  Bytes between images are
  /// ignored, as is an image truncated by the end of the file.
  class MjpegFileSource : public FrameSource
  {

   public:

    /// \brief Constructor.
    MjpegFileSource();

    /// \brief Destructor.  Closes the file.
    virtual ~MjpegFileSource();

    /// \brief Open a file.
    ///
    /// \param  path  The file path.
    ///
    /// \return  True on success.
    bool Open(const std::string& path);

    /// \brief Close the file.
    void Close();

    inline bool IsOpen() const
    {
      return (file_ != NULL);
    }

    virtual bool NextFrame(std::vector<uint8_t>& frame);

    /// \brief Get the number of frames read so far.
    inline uint32_t num_frames() const
    {
      return num_frames_;
    }

   private:

    /// \brief Copy constructor.
    MjpegFileSource(const MjpegFileSource& other);

    /// \brief Copy operator.
    MjpegFileSource& operator=(const MjpegFileSource& other);

    /// The open file.
    FILE*        file_;

    /// The file path, for logging.
    std::string  path_;

    /// The number of frames read.
    uint32_t     num_frames_;

  }; // end class MjpegFileSource

} // namespace gbn

#endif // GBN_STREAMING_MJPEG_FILE_SOURCE_H
