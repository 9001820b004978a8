#include <utility>

#include <boost/container_hash/hash.hpp>

#include <arbnum/runtime/obj/arb_complex.hpp>
#include <arbnum/runtime/core/make_box.hpp>
#include <arbnum/runtime/detail/flint.hpp>
#include <arbnum/util/fmt.hpp>

namespace arbnum::runtime::obj
{
  static arb_real part_of(arb_srcptr const part, bit_precision const precision)
  {
    arb_real ret{ precision };
    arb_set(ret.data, part);
    return ret;
  }

  arb_complex::arb_complex()
    : precision{ working_precision() }
  {
    acb_init(data);
  }

  arb_complex::arb_complex(bit_precision const precision)
    : precision{ precision }
  {
    acb_init(data);
  }

  arb_complex::arb_complex(arb_complex const &o)
    : precision{ o.precision }
  {
    acb_init(data);
    acb_set(data, o.data);
  }

  arb_complex::arb_complex(arb_complex &&o) noexcept
    : precision{ o.precision }
  {
    acb_init(data);
    acb_swap(data, o.data);
  }

  arb_complex::~arb_complex()
  {
    acb_clear(data);
  }

  arb_complex &arb_complex::operator=(arb_complex const &o)
  {
    if(this != &o)
    {
      acb_set(data, o.data);
      precision = o.precision;
    }
    return *this;
  }

  arb_complex &arb_complex::operator=(arb_complex &&o) noexcept
  {
    swap(o);
    return *this;
  }

  arb_complex::arb_complex(std::complex<native_real> const &val, bit_precision const precision)
    : arb_complex{ precision }
  {
    acb_set_d_d(data, val.real(), val.imag());
  }

  arb_complex::arb_complex(arb_real const &re)
    : arb_complex{ re.precision }
  {
    acb_set_arb(data, re.data);
  }

  arb_complex::arb_complex(arb_float const &re)
    : arb_complex{ arb_real{ re } }
  {
  }

  arb_complex::arb_complex(arb_real const &re, arb_real const &im)
    : arb_complex{ max(re.precision, im.precision) }
  {
    acb_set_arb_arb(data, re.data, im.data);
  }

  arb_complex::arb_complex(arb_float const &re, arb_float const &im)
    : arb_complex{ arb_real{ re }, arb_real{ im } }
  {
  }

  void arb_complex::swap(arb_complex &o) noexcept
  {
    acb_swap(data, o.data);
    std::swap(precision, o.precision);
  }

  native_bool arb_complex::equal(arb_complex const &o) const
  {
    return acb_equal(data, o.data);
  }

  native_persistent_string arb_complex::to_string() const
  {
    return to_string(display_options{});
  }

  native_persistent_string arb_complex::to_string(display_options const &opts) const
  {
    auto const re{ part_of(acb_realref(data), precision) };
    auto im{ part_of(acb_imagref(data), precision) };

    util::string_builder buff;
    buff(re.to_string(opts));
    if(arf_sgn(arb_midref(im.data)) < 0)
    {
      arb_neg(im.data, im.data);
      buff(" - ");
    }
    else
    {
      buff(" + ");
    }
    buff(im.to_string(opts))('i');
    return buff.release();
  }

  void arb_complex::to_string(util::string_builder &buff) const
  {
    buff(to_string());
  }

  native_persistent_string arb_complex::to_code_string() const
  {
    return to_string(display_all);
  }

  native_hash arb_complex::to_hash() const
  {
    std::size_t seed{ part_of(acb_realref(data), precision).to_hash() };
    boost::hash_combine(seed, part_of(acb_imagref(data), precision).to_hash());
    return static_cast<native_hash>(seed);
  }

  std::complex<native_real> arb_complex::to_complex() const
  {
    return { arf_get_d(arb_midref(acb_realref(data)), ARF_RND_NEAR),
             arf_get_d(arb_midref(acb_imagref(data)), ARF_RND_NEAR) };
  }

  native_bool arb_complex::is_real() const
  {
    return acb_is_real(data);
  }

  native_bool arb_complex::is_exact() const
  {
    return acb_is_exact(data);
  }

  native_bool arb_complex::is_zero() const
  {
    return acb_is_zero(data);
  }

  native_bool arb_complex::is_finite() const
  {
    return acb_is_finite(data);
  }

  arb_complex_ptr copy(arb_complex_ptr const z)
  {
    return make_box<arb_complex>(*z);
  }

  void swap(arb_complex_ptr const x, arb_complex_ptr const y)
  {
    x->swap(*y);
  }

  arb_real_ptr real(arb_complex_ptr const z)
  {
    auto ret{ make_box<arb_real>(z->precision) };
    arb_set(ret->data, acb_realref(z->data));
    return ret;
  }

  arb_real_ptr imag(arb_complex_ptr const z)
  {
    auto ret{ make_box<arb_real>(z->precision) };
    arb_set(ret->data, acb_imagref(z->data));
    return ret;
  }

  native_bool contains(arb_complex_ptr const x, arb_complex_ptr const y)
  {
    return acb_contains(x->data, y->data);
  }

  native_bool overlaps(arb_complex_ptr const x, arb_complex_ptr const y)
  {
    return acb_overlaps(x->data, y->data);
  }

  arb_complex_ptr operator-(arb_complex_ptr const z)
  {
    auto ret{ make_box<arb_complex>(z->precision) };
    acb_neg(ret->data, z->data);
    return ret;
  }

  // Addition
  arb_complex_ptr operator+(arb_complex_ptr const l, arb_complex_ptr const r)
  {
    auto ret{ make_box<arb_complex>(max(l->precision, r->precision)) };
    acb_add(ret->data, l->data, r->data, ret->precision.bits);
    return ret;
  }

  arb_complex_ptr operator+(arb_complex_ptr const l, native_integer const r)
  {
    return l + make_box<arb_complex>(r, l->precision);
  }

  arb_complex_ptr operator+(native_integer const l, arb_complex_ptr const r)
  {
    return make_box<arb_complex>(l, r->precision) + r;
  }

  // Subtraction
  arb_complex_ptr operator-(arb_complex_ptr const l, arb_complex_ptr const r)
  {
    auto ret{ make_box<arb_complex>(max(l->precision, r->precision)) };
    acb_sub(ret->data, l->data, r->data, ret->precision.bits);
    return ret;
  }

  arb_complex_ptr operator-(arb_complex_ptr const l, native_integer const r)
  {
    return l - make_box<arb_complex>(r, l->precision);
  }

  arb_complex_ptr operator-(native_integer const l, arb_complex_ptr const r)
  {
    return make_box<arb_complex>(l, r->precision) - r;
  }

  // Multiplication
  arb_complex_ptr operator*(arb_complex_ptr const l, arb_complex_ptr const r)
  {
    auto ret{ make_box<arb_complex>(max(l->precision, r->precision)) };
    acb_mul(ret->data, l->data, r->data, ret->precision.bits);
    return ret;
  }

  arb_complex_ptr operator*(arb_complex_ptr const l, native_integer const r)
  {
    return l * make_box<arb_complex>(r, l->precision);
  }

  arb_complex_ptr operator*(native_integer const l, arb_complex_ptr const r)
  {
    return make_box<arb_complex>(l, r->precision) * r;
  }

  // Division
  arb_complex_ptr operator/(arb_complex_ptr const l, arb_complex_ptr const r)
  {
    auto ret{ make_box<arb_complex>(max(l->precision, r->precision)) };
    acb_div(ret->data, l->data, r->data, ret->precision.bits);
    return ret;
  }

  arb_complex_ptr operator/(arb_complex_ptr const l, native_integer const r)
  {
    return l / make_box<arb_complex>(r, l->precision);
  }

  arb_complex_ptr operator/(native_integer const l, arb_complex_ptr const r)
  {
    return make_box<arb_complex>(l, r->precision) / r;
  }

  native_bool operator==(arb_complex_ptr const l, arb_complex_ptr const r)
  {
    return acb_eq(l->data, r->data);
  }

  native_bool operator==(arb_complex_ptr const l, native_integer const r)
  {
    return l == make_box<arb_complex>(r, l->precision);
  }

  native_bool operator!=(arb_complex_ptr const l, arb_complex_ptr const r)
  {
    return acb_ne(l->data, r->data);
  }

  native_bool operator!=(arb_complex_ptr const l, native_integer const r)
  {
    return l != make_box<arb_complex>(r, l->precision);
  }
}
