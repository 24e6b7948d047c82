/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATDELIVER_HPP
#define __SATDELIVER_HPP

#include <satdeliver/config.hpp>
#include <satdeliver/element.hpp>
#include <satdeliver/engine.hpp>
#include <satdeliver/errors.hpp>
#include <satdeliver/inputs.hpp>
#include <satdeliver/parse.hpp>
#include <satdeliver/report.hpp>

#endif
