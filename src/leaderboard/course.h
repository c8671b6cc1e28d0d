// Copyright (c) 2026 The Fairway developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FAIRWAY_LEADERBOARD_COURSE_H
#define FAIRWAY_LEADERBOARD_COURSE_H

/**
 * Course collaborators
 *
 * A course is an external, deterministic challenge. The engine hands it an
 * instantiated solution and a seed; the course either reports the cost of
 * the run or rejects the solution. Courses are referenced from the database
 * by an opaque string and resolved to live objects through CCourseDirectory.
 */

#include "consensus/validation.h"
#include "sync.h"
#include "uint256.h"

#include <map>
#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

/** A solution ready to be run by a course */
struct CSolutionTarget
{
    std::vector<unsigned char> code;
    uint256 hashCode;           // SHA256 of code, identifies the instance

    bool IsNull() const { return hashCode.IsNull(); }
};

class CCourse
{
public:
    virtual ~CCourse() = default;

    virtual std::string GetName() const = 0;

    /**
     * Run - Execute the challenge against a solution
     *
     * @param target  Instantiated solution
     * @param seed    Per-submission seed
     * @param nCost   Output: cost of the run, lower is better
     * @param state   Output: rejection reason (e.g. incorrect-solution)
     * @return        true if the solution solved the challenge
     */
    virtual bool Run(const CSolutionTarget& target, const uint256& seed, uint64_t& nCost, CValidationState& state) = 0;
};

/** Turns raw solution bytes into something a course can run */
class CSolutionDeployer
{
public:
    virtual ~CSolutionDeployer() = default;

    virtual bool Deploy(const std::vector<unsigned char>& code, CSolutionTarget& target, CValidationState& state) = 0;
};

/** Default deployer: enforces the code size limit and fingerprints the code */
class CBytecodeDeployer : public CSolutionDeployer
{
private:
    const size_t nMaxSolutionSize;

public:
    explicit CBytecodeDeployer(size_t nMaxSolutionSizeIn) : nMaxSolutionSize(nMaxSolutionSizeIn) {}

    bool Deploy(const std::vector<unsigned char>& code, CSolutionTarget& target, CValidationState& state) override;
};

/**
 * CCourseDirectory - live course implementations by reference
 */
class CCourseDirectory
{
private:
    mutable RecursiveMutex cs;
    std::map<std::string, std::shared_ptr<CCourse>> mapCourses;

public:
    /** False if the ref is empty, the course is null or the ref is taken */
    bool RegisterCourse(const std::string& strRef, std::shared_ptr<CCourse> course);
    bool UnregisterCourse(const std::string& strRef);

    /** nullptr if the ref is unknown */
    std::shared_ptr<CCourse> Resolve(const std::string& strRef) const;
};

#endif // FAIRWAY_LEADERBOARD_COURSE_H
