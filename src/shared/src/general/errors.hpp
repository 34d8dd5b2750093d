#pragma once

#include "general/errors_forward.hpp"
#include <cstdint>
////////////////////////////////////
// LIST OF ERROR CODES            //
////////////////////////////////////
// These codes describe why a pool operation was rejected.
// Operations report them by throwing an Error, the host
// then rolls back every write of the operation.

// Program errors, range [1-99]:
//   malformed storage, wrong identities, missing signatures.
// Pool errors, range [100-199]:
//   state machine and arithmetic violations.
// Tool errors, range [300-399]:
//   configuration and inspection input.
#define ADDITIONAL_ERRNO_MAP(XX)                                                   \
    XX(0, ENOERROR, "no error")                                                    \
    /*001 - 099: Program errors*/                                                  \
    XX(1, EINV_ARGUMENT, "invalid argument")                                       \
    XX(2, EINV_ACCDATA, "invalid account data")                                    \
    XX(3, EPROGRAMID, "incorrect program id")                                      \
    XX(4, EMISSINGSIG, "missing required signature")                               \
    XX(5, EUNINITACC, "uninitialized account")                                     \
    XX(6, EINSUFFUNDS, "insufficient funds")                                       \
    XX(7, EINV_SEEDS, "invalid seeds for derived address")                         \
    XX(8, EZEROAMOUNTS, "provided amounts cannot be all zero")                     \
    XX(9, ENOTFOUND, "not found")                                                  \
    /*100 - 199: Pool errors*/                                                     \
    XX(100, EINV_INSTRUCTION, "invalid instruction")                               \
    XX(101, EARITHMETIC, "arithmetic operation overflow")                          \
    XX(102, ELOCKEDOP, "operation is locked in the current pool state")            \
    XX(103, ETOOSMALL, "operation too small")                                      \
    /*300 - 399: Tool errors*/                                                     \
    XX(300, EINV_HEX, "cannot parse hexadecimal input")                            \
    XX(301, EMALFORMED, "malformed input")                                         \
    XX(2000, EBUG, "bug-related error")

#define ERR_DEFINE(code, name, _) constexpr int32_t name = code;
ADDITIONAL_ERRNO_MAP(ERR_DEFINE)
#undef ERR_DEFINE
