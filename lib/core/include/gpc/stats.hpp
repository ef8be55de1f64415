#pragma once
#include "gpc/types.hpp"

namespace gpc{

// per axis count, sum and sum of squares of a calibration (sub) session
class AxisStats {
public:
    void reset();
    void push(const Vec3& v);
    int size() const {return n_;}
    Vec3 mean() const;
    Vec3 var() const;       //sample variance, 0 if n<2

private:
    int n_ = 0;
    double sum_[3] = {0.0, 0.0, 0.0};
    double sumsq_[3] = {0.0, 0.0, 0.0};
};

}   // namespace gpc
