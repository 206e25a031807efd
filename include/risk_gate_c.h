#pragma once

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Returns 1 when spread and volatility are within their ceilings, 0 otherwise.
   current_price is accepted for caller compatibility and ignored. */
int is_safe_entry(double current_price, double spread, double volatility, double max_spread, double max_volatility);

/* Returns 1 for a valid order, 0 for a rejection. When reason is non-null the
   reason text is copied into it, truncated to reason_size and NUL-terminated. */
int validate_order(double price, double amount, double min_amount, double max_amount, double balance,
                   char* reason, size_t reason_size);

#ifdef __cplusplus
}
#endif
