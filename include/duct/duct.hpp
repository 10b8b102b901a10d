#pragma once

#include "duct/Environment.hpp"
#include "duct/Error.hpp"
#include "duct/Expression.hpp"
#include "duct/FileDescriptor.hpp"
#include "duct/Handle.hpp"
#include "duct/IoValue.hpp"
#include "duct/Output.hpp"
