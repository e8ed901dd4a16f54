#ifndef SMARTCMD_CORE_STATUS_MACROS_H_
#define SMARTCMD_CORE_STATUS_MACROS_H_

#define SMARTCMD_RETURN_IF_ERROR(expr) \
  if (auto _status = (expr); !_status.ok()) return _status

#define SMARTCMD_ASSIGN_OR_RETURN_IMPL(status_or, lhs, rexpr) \
  auto status_or = (rexpr);                                   \
  if (!status_or.ok()) return status_or.status();             \
  lhs = std::move(*status_or)

#define SMARTCMD_CONCAT_IMPL(x, y) x##y
#define SMARTCMD_CONCAT(x, y) SMARTCMD_CONCAT_IMPL(x, y)

// Evaluates an absl::StatusOr expression; returns its status on failure, otherwise moves the
// value into `lhs` (which may be a declaration).
#define SMARTCMD_ASSIGN_OR_RETURN(lhs, rexpr) \
  SMARTCMD_ASSIGN_OR_RETURN_IMPL(SMARTCMD_CONCAT(_status_or, __LINE__), lhs, rexpr)

#endif  // SMARTCMD_CORE_STATUS_MACROS_H_
