#include "swg/kalman.hpp"

namespace swg{

void AccelKalman::reset(){
    x_ = Vec3{};            //first updates start from rest
    P_ = cfg_.p0;
    K_ = 0.0f;
}

Vec3 AccelKalman::update(const Vec3& z){

    const float P_pred = P_ + cfg_.q;               //A=I, P = P+Q

    K_ = P_pred / (P_pred + cfg_.r);                //kalman gain

    x_.x += K_ * (z.x - x_.x);                      //state update, same gain on every axis
    x_.y += K_ * (z.y - x_.y);
    x_.z += K_ * (z.z - x_.z);

    P_ = (1.0f - K_) * P_pred;                      //cov update

    return x_;
}

}   //namespace swg
