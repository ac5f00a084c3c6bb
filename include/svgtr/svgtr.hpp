// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of svgtr, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <svgtr/core/config_loader.hpp>
#include <svgtr/core/logger.hpp>
#include <svgtr/core/thread_pool.hpp>
#include <svgtr/parsers/json.hpp>
#include <svgtr/parsers/minimal_toml.hpp>
#include <svgtr/parsers/xml.hpp>
#include <svgtr/translate/batch.hpp>
#include <svgtr/translate/extractor.hpp>
#include <svgtr/translate/ids.hpp>
#include <svgtr/translate/injector.hpp>
#include <svgtr/translate/lang.hpp>
#include <svgtr/translate/mapping.hpp>
#include <svgtr/translate/normalizer.hpp>
#include <svgtr/translate/structure_error.hpp>
#include <svgtr/translate/svg.hpp>
#include <svgtr/translate/titles.hpp>
#include <svgtr/translate/workflow.hpp>
#include <svgtr/util/filesystem.hpp>
#include <svgtr/util/text.hpp>
