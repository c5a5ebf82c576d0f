#pragma once

#include <string>

namespace grader {

/**
 * @brief 计算 HMAC-SHA256
 * @param key 共享密钥
 * @param data 原始数据
 * @return 小写十六进制编码的摘要，64 个字符
 */
std::string hmac_sha256_hex(const std::string &key, const std::string &data);

/**
 * @brief 常数时间比较两个字符串
 * 比较时间只和长度有关，和第一个不同字节的位置无关，避免签名被逐字节猜出
 */
bool constant_time_equals(const std::string &a, const std::string &b);

/**
 * @brief 标准 base64 编码，带填充
 */
std::string base64_encode(const std::string &data);

}  // namespace grader
