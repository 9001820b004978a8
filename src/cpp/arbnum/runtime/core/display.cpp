#include <arbnum/runtime/core/display.hpp>

namespace arbnum::runtime
{
  void show(std::ostream &os, obj::mag_ptr const x)
  {
    os << x->to_string();
  }

  void show(std::ostream &os, obj::arb_float_ptr const x, display_options const &opts)
  {
    os << x->to_string(opts);
  }

  void show(std::ostream &os, obj::arb_real_ptr const x, display_options const &opts)
  {
    os << x->to_string(opts);
  }

  void show(std::ostream &os, obj::arb_complex_ptr const z, display_options const &opts)
  {
    os << z->to_string(opts);
  }

  void show_all(std::ostream &os, obj::arb_float_ptr const x)
  {
    show(os, x, display_all);
  }

  void show_all(std::ostream &os, obj::arb_real_ptr const x)
  {
    show(os, x, display_all);
  }

  void show_all(std::ostream &os, obj::arb_complex_ptr const z)
  {
    show(os, z, display_all);
  }
}

namespace arbnum::runtime::obj
{
  std::ostream &operator<<(std::ostream &os, mag_ptr const x)
  {
    show(os, x);
    return os;
  }

  std::ostream &operator<<(std::ostream &os, arb_float_ptr const x)
  {
    show(os, x);
    return os;
  }

  std::ostream &operator<<(std::ostream &os, arb_real_ptr const x)
  {
    show(os, x);
    return os;
  }

  std::ostream &operator<<(std::ostream &os, arb_complex_ptr const z)
  {
    show(os, z);
    return os;
  }
}
