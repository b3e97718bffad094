/**
 * @file utils.h
 * @brief 通用工具函数，提供字符串处理、编码转换等功能
 * @author cRelay Team
 * @date 2026-10-12
 */

#pragma once

#include <string>
#include <chrono>

namespace crelay {

/**
 * @brief 格式化时间间隔
 * @param duration 时间间隔（毫秒）
 * @return 格式化后的字符串（例："1.5s"）
 */
std::string formatDuration(std::chrono::milliseconds duration);

/**
 * @brief 去除字符串首尾空白
 * @param str 要处理的字符串
 * @return 去除空白后的字符串
 */
std::string trimString(const std::string& str);

/**
 * @brief 转换为小写副本
 */
std::string toLowerCopy(const std::string& str);

/**
 * @brief Base64解码（标准字母表，允许末尾'='填充，忽略空白）
 * @param encoded Base64编码的字符串
 * @param decoded 解码结果
 * @return 输入包含非法字符或长度不合法时返回false
 */
bool base64Decode(const std::string& encoded, std::string& decoded);

/**
 * @brief 对URL路径段做百分号编码（RFC 3986 unreserved字符保持原样）
 * @param segment 路径段
 * @return 编码后的字符串
 */
std::string urlEncodePathSegment(const std::string& segment);

/**
 * @brief 截断过长的字符串用于日志输出
 * @param str 原始字符串
 * @param maxLength 最大长度
 * @return 截断后的字符串，超长时以"..."结尾
 */
std::string truncateForLog(const std::string& str, size_t maxLength = 200);

}  // namespace crelay
