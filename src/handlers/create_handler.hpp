#pragma once

#include "holdem/table_state.hpp"

namespace holdem {
namespace handlers {

/// Build an empty table from caller settings, filling in defaults.
Table handle_create(const TableConfig& config);

} // namespace handlers
} // namespace holdem
