#pragma once

#include "config.hpp"
#include "format.hpp"
#include "lookup.hpp"
#include "records.hpp"
#include "session.hpp"
#include "snippet.hpp"
#include "utils.hpp"
