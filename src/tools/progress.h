#pragma once

#include <functional>

class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void reportProgress(double value) = 0;
};

class NullProgressSink : public ProgressSink {
public:
    void reportProgress(double) override {}
};

class ProgressForwarder : public ProgressSink {
public:
    explicit ProgressForwarder(std::function<void(double progress)> callback);
    void reportProgress(double value) override;

private:
    std::function<void(double progress)> callback;
};
