/********************************************************************
 * transcriber.h  –  per-language transcriber facade
 ********************************************************************
Copyright (C) <2025> <Khumnath Cg/nath.khum@gmail.com>

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program. If not, see <https://www.gnu.org/licenses/>
 *******************************************************************/
#pragma once
#include <string>
#include <vector>

#include "libphonema/rewrite_engine.h"
#include "libphonema/rule.h"

/// How far a language's rule table has been taken. Informational only.
enum class CompletionStatus { NotStarted, Incomplete, InProgress, Complete };

/** @brief "not-started", "incomplete", "in-progress" or "complete". */
std::string completionStatusName(CompletionStatus status);

/**
 * @brief Parses a status name.
 * @throws RuleTableError for an unknown name.
 */
CompletionStatus completionStatusFromName(const std::string &name);

// =============================================================================//
// Transcriber Class
// =============================================================================//
/**
 * @brief Binds a rule table and its variant labels to the rewrite engine.
 *
 * A Transcriber is an immutable value: build it once, share it freely.
 * Concurrent calls are safe, every call allocates its own state.
 */
class Transcriber {
public:
    /**
     * @param name Display name of the language or dialect group.
     * @param status Maturity of the table.
     * @param rules The ordered rule table.
     * @param variantLabels Output labels, in alternative order. Must not be empty.
     * @param fallback Policy for uncovered graphemes. Defaults to reporting on
     * std::cerr and copying through.
     * @throws RuleTableError if @p variantLabels is empty.
     */
    Transcriber(std::string name, CompletionStatus status, RuleTable rules,
                std::vector<std::string> variantLabels,
                FallbackPolicy fallback = FallbackPolicy());

    /**
     * @brief Loads a transcriber from a rule table file.
     * @throws std::runtime_error if the file cannot be read.
     * @throws RuleTableError if the file is malformed.
     */
    static Transcriber fromFile(const std::string &path, FallbackPolicy fallback = FallbackPolicy());

    /**
     * @brief Parses a transcriber from rule table text.
     * @param content The table file contents.
     * @param sourceName Name used in error messages.
     */
    static Transcriber fromString(const std::string &content, const std::string &sourceName = "<string>",
                                  FallbackPolicy fallback = FallbackPolicy());

    /** @brief Transcribes UTF-8 text into every declared variant. */
    TranscriptionResult transcribe(const std::string &nativeText) const;

    /** @brief Returns only the first variant's text. */
    std::string transcribeToIpa(const std::string &nativeText) const;

    const std::string &name() const { return name_; }
    CompletionStatus completionStatus() const { return status_; }
    const RuleTable &rules() const { return rules_; }
    const std::vector<std::string> &variantLabels() const { return variantLabels_; }

    /** @brief Returns a copy of this transcriber using another fallback policy. */
    Transcriber withFallback(FallbackPolicy fallback) const;

private:
    std::string name_;
    CompletionStatus status_;
    RuleTable rules_;
    std::vector<std::string> variantLabels_;
    FallbackPolicy fallback_;
};
