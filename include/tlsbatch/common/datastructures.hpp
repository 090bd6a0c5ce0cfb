// Copyright (c) 2025 tlsbatch contributors

// This file is part of tlsbatch

// tlsbatch is free software: you can redistribute it and/or modify it
// under the terms of the GNU General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version. tlsbatch is distributed in the hope that it will be
// useful, but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General
// Public License for more details. You should have received a copy of the GNU
// General Public License along with tlsbatch. If not, see
// <https://www.gnu.org/licenses/>.

#pragma once

#include <exception>
#include <string>

#include <tlsbatch/common/common.hpp>

namespace tlsbatch {

  class tlsbatchException : public std::exception {
   public:
    explicit tlsbatchException(const std::string& message)
        : msg_("Error: " + message) {}
    virtual const char* what() const throw() { return msg_.c_str(); }

   protected:
    std::string msg_;
  };

  // A required top level directory of the project is missing.
  class ProjectStructureError : public tlsbatchException {
   public:
    explicit ProjectStructureError(const std::string& message)
        : tlsbatchException(message) {}
  };

  // Invalid parameters or inputs that make the run meaningless.
  class ConfigurationError : public tlsbatchException {
   public:
    explicit ConfigurationError(const std::string& message)
        : tlsbatchException(message) {}
  };

}  // namespace tlsbatch
