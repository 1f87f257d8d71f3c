/*
 * chisel
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef CHISEL_CHISEL_HPP
#define CHISEL_CHISEL_HPP

#pragma once

#include "config.hpp"
#include "error.hpp"
#include "source.hpp"
#include "decoder.hpp"
#include "lexer.hpp"
#include "number.hpp"
#include "events.hpp"
#include "sax.hpp"
#include "value.hpp"
#include "dom.hpp"
#include "writer.hpp"
#include "pointer.hpp"

#endif // CHISEL_CHISEL_HPP
