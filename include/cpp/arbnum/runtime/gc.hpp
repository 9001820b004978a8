#pragma once

#include <boost/smart_ptr/intrusive_ptr.hpp>
#include <boost/smart_ptr/intrusive_ref_counter.hpp>

namespace arbnum::runtime
{
  /* Base of every boxed runtime value. The count lives in the object, so a box
   * is a single pointer. When the last box is released the object's destructor
   * runs, and that is where native limbs get handed back to FLINT. */
  template <typename T>
  using gc = boost::intrusive_ref_counter<T, boost::thread_safe_counter>;

  template <typename T>
  using native_box = boost::intrusive_ptr<T>;
}
