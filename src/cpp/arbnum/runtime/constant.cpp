#include <arbnum/runtime/constant.hpp>

namespace arbnum::runtime
{
  char const *constant_str(constant const c)
  {
    switch(c)
    {
      case constant::pi:
        return "pi";
      case constant::e:
        return "e";
      case constant::log2:
        return "log2";
      case constant::euler:
        return "euler";
      case constant::catalan:
        return "catalan";
    }
    return "unknown";
  }
}
