#include <kdeflow/core/column.hpp>
#include <kdeflow/core/list_column.hpp>

#include <cstdint>
#include <string>

// Column<T> and ListColumn<T> are header-only templates.
// Explicit instantiations for the element types the runtime stores.

namespace kdeflow {

template class Column<std::int64_t>;
template class Column<float>;
template class Column<double>;
template class Column<std::string>;

template class ListColumn<float>;
template class ListColumn<double>;

}  // namespace kdeflow
