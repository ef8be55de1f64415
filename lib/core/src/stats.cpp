#include "gpc/stats.hpp"
#include <algorithm>

namespace gpc{

void AxisStats::reset(){
    n_ = 0;
    for (int i = 0; i < 3; ++i) {
        sum_[i] = 0.0;
        sumsq_[i] = 0.0;
    }
}

void AxisStats::push(const Vec3& v){
    for (int i = 0; i < 3; ++i) {
        const double x = v.axis(i);
        sum_[i] += x;
        sumsq_[i] += x * x;
    }
    n_++;
}

Vec3 AxisStats::mean() const {
    Vec3 m {0,0,0};
    if (n_ == 0) return m;
    for (int i = 0; i < 3; ++i) m.set_axis(i, float(sum_[i] / double(n_)));
    return m;
}

Vec3 AxisStats::var() const {
    Vec3 v {0,0,0};
    if (n_ < 2) return v;
    for (int i = 0; i < 3; ++i) {
        const double mu = sum_[i] / double(n_);
        const double var_samp = (sumsq_[i] - double(n_) * mu * mu) / double(n_ - 1);
        v.set_axis(i, float(std::max(0.0, var_samp)));
    }
    return v;
}

}   // namespace gpc
