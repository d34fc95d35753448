#pragma once

#include <cstdio>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <system_error>

#include <spdlog/spdlog.h>

#include "version.hpp"

#include "utils.hpp"
#include "cmd.hpp"
#include "config.hpp"
#include "file.hpp"

#include "parser.hpp"
#include "crypto.hpp"
#include "address.hpp"
#include "word.hpp"
#include "abi.hpp"
#include "parameter_store.hpp"
#include "decoder.hpp"
#include "stream.hpp"
#include "host.hpp"
