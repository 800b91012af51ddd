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

#ifndef GBN_COMMON_CONFIG_INFO_H
#define GBN_COMMON_CONFIG_INFO_H

#include <map>
#include <string>

#include <stdint.h>

#define LOG_CUSTOMIZATIONS true

///
/// Support for accessing properties from a file.
///

namespace gbn
{

  ///
  /// Properties are specifed in configuration files as "key value" pairs. The
  /// key cannot include a space in its definition, but may include other
  /// separation characters such as '.', '_', '-', etc. The value is
  /// interpreted as the remainder of the line on which the key is found.
  /// Leading and trailing whitespace is removed from the value.
  ///
  /// Comments may be inserted into the property file using the '#'
  /// character. The '#' character MUST be the first non-blank character of
  /// comment lines in the configuration file.
  ///
  /// A line of the form "include <file>" loads another configuration file.
  /// A relative path is interpreted relative to the directory of the file
  /// containing the directive.
  ///
  /// A number of accessor methods enable users to request configuration
  /// information associated with a provided key. The accessors return the
  /// provided default values if the requested key does not map to a
  /// configuration item.
  ///
  class ConfigInfo
  {
    public:

    ///
    /// Default no-arg constructor.
    ///
    ConfigInfo();

    ///
    /// Destructor.
    ///
    virtual ~ConfigInfo();

    ///
    /// Add a configuration item, a key and value pair, to the collection of
    /// configuration information. Note that any previous value assigned to
    /// the key will be replaced by the new value.
    ///
    /// \param  key    The configuration item key.
    /// \param  value  The configuration item value.
    ///
    void Add(const std::string& key, const std::string& value);

    ///
    /// Loads the configuration information from a file.
    ///
    /// \param  file_name  The name of the file containing the configuration
    ///                    information.
    ///
    /// \return true if the configuration information is loaded successfully,
    ///         false otherwise.
    ///
    bool LoadFromFile(const std::string& file_name);

    ///
    /// Get a string representation of the configuration information, one
    /// "key value" pair per line.
    ///
    /// \return The string representation.
    ///
    std::string ToString() const;

    ///
    /// Get the value of a configuration item as a string.
    ///
    /// \param  key                 The configuration item key.
    /// \param  default_value       The value returned if the key is not
    ///                             found.
    /// \param  log_customizations  If true, a value differing from a
    ///                             non-empty default is logged.
    ///
    /// \return The configuration item value, or the default value.
    ///
    std::string Get(const std::string& key,
                    const std::string& default_value = "",
                    bool log_customizations = LOG_CUSTOMIZATIONS) const;

    ///
    /// Get the value of a configuration item as a boolean.
    ///
    /// \param  key                 The configuration item key.
    /// \param  default_value       The value returned if the key is not
    ///                             found or cannot be converted.
    /// \param  log_customizations  If true, a value differing from the
    ///                             default is logged.
    ///
    /// \return The configuration item value, or the default value.
    ///
    bool GetBool(const std::string& key, const bool default_value,
                 bool log_customizations = LOG_CUSTOMIZATIONS) const;

    ///
    /// Get the value of a configuration item as an integer.
    ///
    int GetInt(const std::string& key, const int default_value,
               bool log_customizations = LOG_CUSTOMIZATIONS) const;

    ///
    /// Get the value of a configuration item as an unsigned integer.
    ///
    unsigned int GetUint(const std::string& key,
                         const unsigned int default_value,
                         bool log_customizations = LOG_CUSTOMIZATIONS) const;

    ///
    /// Get the value of a configuration item as a 64-bit unsigned integer.
    ///
    uint64_t GetUint64(const std::string& key, const uint64_t default_value,
                       bool log_customizations = LOG_CUSTOMIZATIONS) const;

    ///
    /// Get the value of a configuration item as a float.
    ///
    float GetFloat(const std::string& key, const float default_value,
                   bool log_customizations = LOG_CUSTOMIZATIONS) const;

    ///
    /// Get the value of a configuration item as a double.
    ///
    double GetDouble(const std::string& key, const double default_value,
                     bool log_customizations = LOG_CUSTOMIZATIONS) const;

    ///
    /// Remove all configuration items.
    ///
    inline void Reset()
    {
      config_items_.clear();
    }

    private:

    ///
    /// Copy constructor.
    ///
    ConfigInfo(const ConfigInfo& other);

    ///
    /// Copy operator.
    ///
    ConfigInfo& operator=(const ConfigInfo& other);

    ///
    /// The collection of configuration items.
    ///
    std::map<std::string, std::string>  config_items_;

  }; // end class ConfigInfo

} // namespace gbn

#endif // GBN_COMMON_CONFIG_INFO_H
