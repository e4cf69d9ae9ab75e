#include <tabula/core/column.hpp>

#include <cstdint>
#include <string>

// Column<T> is header-only; the element types a Table can hold are
// instantiated here once to keep the other translation units lighter.

namespace tabula {

template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;

}  // namespace tabula
