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

/// \brief The GbnStream callback header file.
///
/// Provides the GbnStream software with a simple, flexible, object-oriented
/// callback capability.  Callback methods may include zero or one arguments.

#ifndef GBN_COMMON_CALLBACK_H
#define GBN_COMMON_CALLBACK_H

#include <new>

#include <stdlib.h>

namespace gbn
{

  /// \brief The abstract base class for all callback objects.
  ///
  /// This interface implements the callback "springboard", converting a
  /// single, common form of object-oriented callback into a user-defined form
  /// of object-oriented callback.  The user implements child classes of this
  /// abstract base class using the CallbackNoArg and CallbackOneArg C++
  /// templates.
  ///
  /// Clones are heap allocated and owned by the service that created them.
  /// There is no shared pool of clones, so clones may be created and
  /// released concurrently from several threads.
  class CallbackInterface
  {

   public:

    /// \brief The callback interface destructor.
    virtual ~CallbackInterface()
    { }

    /// \brief The method that is called to initiate the callback.
    virtual void PerformCallback() = 0;

    /// \brief The method that is called to copy the callback object.
    ///
    /// \return  A pointer to a copy of this object, or NULL if the copy
    ///          could not be allocated.
    virtual CallbackInterface* Clone() = 0;

    /// \brief The method that is called to release a callback object copy.
    ///
    /// Call this method on the object returned by the Clone() method, then
    /// let go of the pointer.
    virtual void ReleaseClone() = 0;

  }; // end class CallbackInterface

  /// \brief The template for a callback having no arguments.
  ///
  /// \code
  /// class GbnSender
  /// {
  ///   void OnTimeout() { ... }
  /// };
  ///
  /// CallbackNoArg<GbnSender>  cb(this, &GbnSender::OnTimeout);
  /// timer_.StartTimer(rto_, &cb, rto_handle_);
  /// \endcode
  ///
  /// \tparam  T  The class that is to receive the callback.
  template<class T>
  class CallbackNoArg : public CallbackInterface
  {

   public:

    /// \brief The constructor.
    ///
    /// \param  instance  The class instance that will receive the callback.
    /// \param  method    The class method that will be called for the
    ///                   callback.
    CallbackNoArg(T* instance, void (T::*method)())
        : instance_(instance), method_(method)
    { }

    /// \brief The copy constructor.
    ///
    /// \param  cb  The object to be copied.
    CallbackNoArg(const CallbackNoArg<T>& cb)
        : instance_(cb.instance_), method_(cb.method_)
    { }

    /// \brief The destructor.
    virtual ~CallbackNoArg()
    { }

    /// \brief Perform the callback on the stored instance.
    virtual void PerformCallback()
    {
      (instance_->*method_)();
    }

    /// \brief Copy the callback object.
    ///
    /// \return  A pointer to a copy of this object.
    virtual CallbackInterface* Clone()
    {
      return new (std::nothrow) CallbackNoArg<T>(*this);
    }

    /// \brief Release a copy created by Clone().
    virtual void ReleaseClone()
    {
      delete this;
    }

   private:

    /// \brief Copy operator.
    CallbackNoArg<T>& operator=(const CallbackNoArg<T>& other);

    /// A pointer to the callback object instance.
    T*    instance_;

    /// A method pointer to the callback class method.
    void  (T::*method_)();

  }; // end class CallbackNoArg

  /// \brief The template for a callback having one argument.
  ///
  /// The argument is copied into the callback object, so use a pointer type
  /// if the argument is not copyable.  The argument must never be a
  /// reference.
  ///
  /// \tparam  T   The class that is to receive the callback.
  /// \tparam  A1  The type for the argument in the callback.
  template<class T, class A1>
  class CallbackOneArg : public CallbackInterface
  {

   public:

    /// \brief The constructor.
    ///
    /// \param  instance  The class instance that will receive the callback.
    /// \param  method    The class method that will be called for the
    ///                   callback.
    /// \param  arg1      The argument that will be passed to the callback.
    CallbackOneArg(T* instance, void (T::*method)(A1 arg1), A1 arg1)
        : instance_(instance), method_(method), arg1_(arg1)
    { }

    /// \brief The copy constructor.
    ///
    /// \param  cb  The object to be copied.
    CallbackOneArg(const CallbackOneArg<T, A1>& cb)
        : instance_(cb.instance_), method_(cb.method_), arg1_(cb.arg1_)
    { }

    /// \brief The destructor.
    virtual ~CallbackOneArg()
    { }

    /// \brief Perform the callback on the stored instance.
    virtual void PerformCallback()
    {
      (instance_->*method_)(arg1_);
    }

    /// \brief Copy the callback object.
    ///
    /// \return  A pointer to a copy of this object.
    virtual CallbackInterface* Clone()
    {
      return new (std::nothrow) CallbackOneArg<T, A1>(*this);
    }

    /// \brief Release a copy created by Clone().
    virtual void ReleaseClone()
    {
      delete this;
    }

   private:

    /// \brief Copy operator.
    CallbackOneArg<T, A1>& operator=(const CallbackOneArg<T, A1>& other);

    /// A pointer to the callback object instance.
    T*    instance_;

    /// A method pointer to the callback class method.
    void  (T::*method_)(A1 arg1);

    /// The callback argument.
    A1    arg1_;

  }; // end class CallbackOneArg

} // namespace gbn

#endif // GBN_COMMON_CALLBACK_H
