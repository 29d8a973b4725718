/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-1-4

Description: Sandbox infrastructure exceptions

**************************************************/

#ifndef WARDEN_SANDBOX_EXCEPTION_HPP
#define WARDEN_SANDBOX_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace warden {

/**
 * @brief The sandbox itself failed (spawn, handshake, IPC, limit setup).
 *
 * Never raised for anything the user code did; those outcomes are reported
 * in ExecutionResult.
 */
class SandboxFault : public atom::error::Exception {
public:
    using Exception::Exception;
};

}  // namespace warden

#define THROW_SANDBOX_FAULT(...)                                \
    throw warden::SandboxFault(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                               ATOM_FUNC_NAME, __VA_ARGS__)

#endif  // WARDEN_SANDBOX_EXCEPTION_HPP
