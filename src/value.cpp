#include "eqv/value.hpp"
#include "eqv/exceptions.hpp"
#include "eqv/type.hpp"

#include <cstring>
#include <format>


static eqv::object**
_allocate_slots(size_t n)
{
  if (n == 0)
    return nullptr;
  auto slots = static_cast<eqv::object**>(eqv::allocate(n * sizeof(eqv::object*)));
  for (size_t i = 0; i < n; ++i)
    slots[i] = &*eqv::nil;
  return slots;
}


eqv::value
eqv::str(std::string_view x)
{
  value ret {make<object>(tag::str)};
  ret->str.data = static_cast<char*>(allocate_atomic(x.length() + 1));
  std::memcpy(ret->str.data, x.data(), x.length());
  ret->str.data[x.length()] = '\0';
  ret->str.len = x.length();
  return ret;
}


const eqv::type*
eqv::type_of(value x)
{
  switch (x->t)
  {
    case tag::nil: return nullptr;
    case tag::boolean: return boolean_type();
    case tag::integer: return integer_type();
    case tag::real: return real_type();
    case tag::str: return string_type();
    case tag::seq:
    case tag::obj: return x->ty;
  }
  throw std::invalid_argument {"type_of() - corrupt object tag"};
}


eqv::value
eqv::make_sequence(const type *t)
{
  if (t == nullptr)
    t = sequence_type();
  if (t->kind() != type_kind::sequence)
    throw std::invalid_argument {
        std::format("make_sequence() - not a sequence type ({})", t->full_name())};

  value ret {make<object>(tag::seq)};
  ret->ty = t;
  ret->seq.data = nullptr;
  ret->seq.len = 0;
  ret->seq.cap = 0;
  return ret;
}


eqv::value
eqv::make_object(const type *t)
{
  if (t == nullptr)
    throw std::invalid_argument {"make_object() - null type"};
  if (t->kind() != type_kind::object and t->kind() != type_kind::value)
    throw std::invalid_argument {
        std::format("make_object() - can't instantiate {} type {}",
                    type_kind_name(t->kind()), t->full_name())};
  if (t == boolean_type() or t == integer_type() or t == real_type())
    throw std::invalid_argument {
        std::format("make_object() - {} is a built-in scalar", t->full_name())};

  value ret {make<object>(tag::obj)};
  ret->ty = t;
  ret->obj.nslots = t->fields().size();
  ret->obj.slots = _allocate_slots(ret->obj.nslots);
  return ret;
}


eqv::value
eqv::make_object(const type *t,
                 std::initializer_list<std::pair<std::string_view, value>> fields)
{
  const value ret = make_object(t);
  for (const auto &[name, x] : fields)
    set_field(ret, name, x);
  return ret;
}


eqv::value
eqv::seq_ref(value x, size_t i)
{
  if (not isseq(x))
    throw std::invalid_argument {"seq_ref() - not a sequence"};
  if (i >= x->seq.len)
    throw std::out_of_range {
        std::format("seq_ref() - index {} out of range (length {})", i,
                    x->seq.len)};
  return value {x->seq.data[i]};
}


void
eqv::set_element(value x, size_t i, value elt)
{
  if (not isseq(x))
    throw std::invalid_argument {"set_element() - not a sequence"};
  if (i >= x->seq.len)
    throw std::out_of_range {
        std::format("set_element() - index {} out of range (length {})", i,
                    x->seq.len)};
  x->seq.data[i] = &*elt;
}


void
eqv::push_back(value x, value elt)
{
  if (not isseq(x))
    throw std::invalid_argument {"push_back() - not a sequence"};

  if (x->seq.len == x->seq.cap)
  {
    const size_t newcap = x->seq.cap == 0 ? 4 : x->seq.cap * 2;
    auto data = static_cast<object**>(allocate(newcap * sizeof(object*)));
    if (x->seq.len > 0)
      std::memcpy(data, x->seq.data, x->seq.len * sizeof(object*));
    x->seq.data = data;
    x->seq.cap = newcap;
  }
  x->seq.data[x->seq.len++] = &*elt;
}


eqv::value
eqv::field_ref(value x, size_t slot)
{
  if (not isobj(x))
    throw std::invalid_argument {"field_ref() - not an object"};
  if (slot >= x->obj.nslots)
    throw std::out_of_range {
        std::format("field_ref() - no slot {} in {}", slot,
                    x->ty->full_name())};
  return value {x->obj.slots[slot]};
}


static const eqv::field_info&
_lookup_field(eqv::value x, std::string_view name, const char *who)
{
  if (not eqv::isobj(x))
    throw std::invalid_argument {std::format("{}() - not an object", who)};

  const eqv::field_info *field = x->ty->find_field(name);
  if (field == nullptr)
    throw std::invalid_argument {
        std::format("{}() - no field '{}' in {}", who, name,
                    x->ty->full_name())};
  return *field;
}


eqv::value
eqv::get_field(value x, std::string_view name)
{
  const field_info &field = _lookup_field(x, name, "get_field");
  return value {x->obj.slots[field.slot]};
}


void
eqv::set_field(value x, std::string_view name, value field_value)
{
  const field_info &field = _lookup_field(x, name, "set_field");
  if (not is_instance(field_value, field.declared))
    throw type_error {
        std::format("set_field() - {} is not assignable to {}.{} of type {}",
                    type_of(field_value)->full_name(), x->ty->full_name(),
                    field.name, field.declared->full_name())};
  x->obj.slots[field.slot] = &*field_value;
}
