#pragma once
/**
 * @file safeprint.hpp
 * @brief safeprint 공개 API 모음 헤더
 */
#include "safeprint/ansi_style.hpp"
#include "safeprint/error_reporter.hpp"
#include "safeprint/errors.hpp"
#include "safeprint/printer.hpp"
#include "safeprint/rotating_log.hpp"
#include "safeprint/sanitizer.hpp"
#include "safeprint/value.hpp"
#include "safeprint/value_format.hpp"
