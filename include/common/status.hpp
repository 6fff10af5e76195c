#pragma once

namespace coderun {

/**
 * @brief 表示整个提交的评测结果
 */
enum class status {
    /**
     * @brief 所有测试点都通过
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 没有任何测试点通过时，无论失败原因是什么都返回 WA。
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序运行超时
     * 部分测试点通过，且某个失败测试点的错误信息中包含 timeout
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序编译错误
     * 部分测试点通过，且某个失败测试点的错误信息中包含 compilation
     */
    COMPILATION_ERROR = 3,

    /**
     * @brief 评测过程出现异常
     * 包括提交请求不合法，此时没有任何测试点结果
     */
    RUNTIME_ERROR = 4
};

const char *get_display_message(status);

}  // namespace coderun
