#pragma once

#include <filesystem>

#include "logging/entry.h"

// Marker class for semantic entries
class SemanticEntry : public logging::Entry {
public:
    SemanticEntry(logging::Level level, const std::string& message);
};

class StartEntry : public SemanticEntry {
public:
    explicit StartEntry(const std::filesystem::path& inputFilePath);
    std::filesystem::path getInputFilePath() const;

private:
    std::filesystem::path inputFilePath;
};

// Starts rendering a scene, which reports progress until the next scene or the end
class SceneStartEntry : public SemanticEntry {
public:
    SceneStartEntry(const std::string& sceneName, int frameCount);
    const std::string& getSceneName() const;
    int getFrameCount() const;

private:
    std::string sceneName;
    int frameCount;
};

class ProgressEntry : public SemanticEntry {
public:
    explicit ProgressEntry(double progress);
    double getProgress() const;

private:
    double progress;
};

class SuccessEntry : public SemanticEntry {
public:
    explicit SuccessEntry(int frameCount);
    int getFrameCount() const;

private:
    int frameCount;
};

class FailureEntry : public SemanticEntry {
public:
    explicit FailureEntry(const std::string& reason);
    std::string getReason() const;

private:
    std::string reason;
};
